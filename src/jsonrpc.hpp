#pragma once
#include "errors.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace toolhost {
namespace jsonrpc {

constexpr const char* kVersion = "2.0";
constexpr int kMethodNotFound = -32601;

nlohmann::json make_request(int64_t id, const std::string& method, const nlohmann::json& params);
nlohmann::json make_notification(const std::string& method,
                                 const nlohmann::json& params = nlohmann::json());
nlohmann::json make_result(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message);

enum class MessageKind {
    Response,      // has "id", no "method"
    Notification,  // no "id" (or null id with a method)
    Request,       // "method" plus a non-null "id": server-initiated
    Invalid,       // not an object
};

MessageKind classify(const nlohmann::json& msg);

enum class IdMatch {
    Match,
    Stale,      // an earlier id on this connection
    Unrelated,  // null, non-numeric, or never issued
};

// Accepts numeric ids and decimal strings ("7").
IdMatch match_id(const nlohmann::json& id, int64_t expected);

// Build a RemoteError from an "error" member. Integer and string codes
// are both accepted.
RemoteError remote_error(const nlohmann::json& error);

bool is_unknown_method(const RemoteError& err);

// "ns/sub/method" -> "method"; nullopt when there is no separator.
std::optional<std::string> fallback_method(const std::string& method);

// Compact single-line encoding; invalid UTF-8 is replaced, never thrown.
std::string encode(const nlohmann::json& msg);

} // namespace jsonrpc
} // namespace toolhost
