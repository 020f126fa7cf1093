#include "json_path.hpp"
#include "util.hpp"

#include <vector>

namespace toolhost {

namespace {

const char* kind_name(const nlohmann::json& v) {
    switch (v.type()) {
        case nlohmann::json::value_t::object: return "object";
        case nlohmann::json::value_t::array: return "array";
        case nlohmann::json::value_t::string: return "string";
        case nlohmann::json::value_t::boolean: return "boolean";
        case nlohmann::json::value_t::null: return "null";
        default: return "number";
    }
}

const nlohmann::json& index_array(const nlohmann::json& current, const std::string& index,
                                  const std::string& segment) {
    if (!current.is_array()) {
        throw JsonPathError("cannot index " + std::string(kind_name(current)) + " with [" +
                            index + "] in segment \"" + segment + "\"");
    }
    if (!is_all_digits(index) || index.size() > 9) {
        throw JsonPathError("invalid array index [" + index + "] in segment \"" + segment + "\"");
    }
    size_t i = std::stoul(index);
    if (i >= current.size()) {
        throw JsonPathError("array index " + index + " out of range (length " +
                            std::to_string(current.size()) + ")");
    }
    return current[i];
}

const nlohmann::json& lookup_key(const nlohmann::json& current, const std::string& key) {
    if (current.is_object()) {
        auto it = current.find(key);
        if (it == current.end()) {
            throw JsonPathError("key \"" + key + "\" not found");
        }
        return *it;
    }
    if (current.is_array()) {
        if (!is_all_digits(key)) {
            throw JsonPathError("cannot use key \"" + key + "\" on array");
        }
        return index_array(current, key, key);
    }
    throw JsonPathError("cannot look up key \"" + key + "\" in " + kind_name(current));
}

} // namespace

std::string json_to_text(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string extract_json_path(const nlohmann::json& doc, const std::string& path) {
    if (path.empty()) return json_to_text(doc);

    const nlohmann::json* current = &doc;
    for (const auto& segment : split(path, '.')) {
        if (segment.empty()) {
            throw JsonPathError("empty segment in path \"" + path + "\"");
        }
        size_t bracket = segment.find('[');
        std::string key = segment.substr(0, bracket);
        if (!key.empty()) current = &lookup_key(*current, key);
        if (bracket == std::string::npos) continue;

        // One or more trailing [N] groups
        size_t pos = bracket;
        while (pos < segment.size()) {
            if (segment[pos] != '[') {
                throw JsonPathError("malformed segment \"" + segment + "\"");
            }
            size_t close = segment.find(']', pos);
            if (close == std::string::npos) {
                throw JsonPathError("unclosed bracket in segment \"" + segment + "\"");
            }
            current = &index_array(*current, segment.substr(pos + 1, close - pos - 1), segment);
            pos = close + 1;
        }
    }
    return json_to_text(*current);
}

std::string extract_json_path(const std::string& raw, const std::string& path) {
    auto doc = nlohmann::json::parse(raw, nullptr, false);
    if (doc.is_discarded()) {
        throw JsonPathError("output is not valid JSON");
    }
    return extract_json_path(doc, path);
}

} // namespace toolhost
