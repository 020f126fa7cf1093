#include "jsonrpc.hpp"
#include "util.hpp"

#include <cmath>

namespace toolhost {
namespace jsonrpc {

using json = nlohmann::json;

json make_request(int64_t id, const std::string& method, const json& params) {
    json msg = {{"jsonrpc", kVersion}, {"id", id}, {"method", method}};
    msg["params"] = params.is_null() ? json::object() : params;
    return msg;
}

json make_notification(const std::string& method, const json& params) {
    json msg = {{"jsonrpc", kVersion}, {"method", method}};
    if (!params.is_null()) msg["params"] = params;
    return msg;
}

json make_result(const json& id, const json& result) {
    return {{"jsonrpc", kVersion}, {"id", id}, {"result", result}};
}

json make_error(const json& id, int code, const std::string& message) {
    return {{"jsonrpc", kVersion}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

MessageKind classify(const json& msg) {
    if (!msg.is_object()) return MessageKind::Invalid;
    bool has_method = msg.contains("method") && msg["method"].is_string();
    auto id = msg.find("id");
    bool has_id = id != msg.end();
    if (has_method) {
        return (has_id && !id->is_null()) ? MessageKind::Request : MessageKind::Notification;
    }
    return has_id ? MessageKind::Response : MessageKind::Notification;
}

IdMatch match_id(const json& id, int64_t expected) {
    int64_t value = 0;
    if (id.is_number_integer()) {
        value = id.get<int64_t>();
    } else if (id.is_number_float()) {
        double d = id.get<double>();
        // 2^63 is exactly representable; anything at or past it would overflow the cast
        if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
            return IdMatch::Unrelated;
        }
        if (d != std::trunc(d)) return IdMatch::Unrelated;
        value = static_cast<int64_t>(d);
    } else if (id.is_string()) {
        std::string s = trim(id.get<std::string>());
        if (!is_all_digits(s) || s.size() > 18) return IdMatch::Unrelated;
        value = std::stoll(s);
    } else {
        return IdMatch::Unrelated;
    }
    if (value == expected) return IdMatch::Match;
    if (value >= 1 && value < expected) return IdMatch::Stale;
    return IdMatch::Unrelated;
}

RemoteError remote_error(const json& error) {
    int code = 0;
    std::string code_text;
    std::string message;
    if (error.is_object()) {
        auto c = error.find("code");
        if (c != error.end()) {
            if (c->is_number_integer()) {
                code = c->get<int>();
                code_text = std::to_string(code);
            } else if (c->is_string()) {
                code_text = c->get<std::string>();
            } else if (!c->is_null()) {
                code_text = c->dump();
            }
        }
        auto m = error.find("message");
        if (m != error.end()) message = m->is_string() ? m->get<std::string>() : m->dump();
    } else if (error.is_string()) {
        message = error.get<std::string>();
    } else {
        message = error.dump();
    }
    return RemoteError(code, code_text, message);
}

bool is_unknown_method(const RemoteError& err) {
    if (err.code() == kMethodNotFound) return true;
    if (err.code_text() == "UNKNOWN_METHOD") return true;
    return contains_ci(err.remote_message(), "unknown method") ||
           contains_ci(err.remote_message(), "method not found");
}

std::optional<std::string> fallback_method(const std::string& method) {
    size_t pos = method.rfind('/');
    if (pos == std::string::npos || pos + 1 >= method.size()) return std::nullopt;
    return method.substr(pos + 1);
}

std::string encode(const json& msg) {
    return msg.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace jsonrpc
} // namespace toolhost
