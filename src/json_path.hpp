#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace toolhost {

class JsonPathError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Walk `path` ("a.b", "data[0].name", "data.0.name", "m[1][2]") through
// `doc`. Scalars come back as plain text (strings unquoted), objects and
// arrays as compact JSON. An empty path returns the whole document.
// Throws JsonPathError naming the segment that failed.
std::string extract_json_path(const nlohmann::json& doc, const std::string& path);

// Same, parsing `raw` first. Unparseable input is a JsonPathError.
std::string extract_json_path(const std::string& raw, const std::string& path);

// Plain-text form used for extracted values.
std::string json_to_text(const nlohmann::json& value);

} // namespace toolhost
