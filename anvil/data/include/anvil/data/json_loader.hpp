#pragma once

#include <anvil/core/log.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <fstream>

namespace anvil::data {

// ============================================================================
// LoadResult - Records read from a JSON array, plus per-entry errors
// ============================================================================

template<typename T>
struct LoadResult {
    std::vector<T> items;
    std::vector<std::string> errors;
    size_t total_processed = 0;

    bool success() const { return errors.empty(); }
    size_t loaded_count() const { return items.size(); }
    size_t error_count() const { return errors.size(); }
};

// ============================================================================
// Documents
// ============================================================================

// nullopt if the file cannot be opened or does not parse
inline std::optional<nlohmann::json> load_json_file(const std::string& path, std::string* out_error = nullptr) {
    std::ifstream file(path);
    if (!file.is_open()) {
        core::log(core::LogLevel::Error, "[JsonLoader] Failed to open file: {}", path);
        if (out_error) *out_error = "Failed to open file: " + path;
        return std::nullopt;
    }

    nlohmann::json document = nlohmann::json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        core::log(core::LogLevel::Error, "[JsonLoader] Parse error in {}", path);
        if (out_error) *out_error = "Parse error in " + path;
        return std::nullopt;
    }
    return document;
}

// ============================================================================
// parse_json_array - One record per object in an array
// ============================================================================
//
// The deserializer has the shape
//     std::optional<T> fn(const nlohmann::json& obj, std::string& out_error)
// and every failure is collected; parsing continues with the next entry.
// With an empty array_key the root itself must be the array.

template<typename T, typename Deserializer>
LoadResult<T> parse_json_array(const nlohmann::json& root, Deserializer deserialize_fn,
                               const std::string& array_key = "") {
    LoadResult<T> result;

    if (array_key.empty() && !root.is_array()) {
        result.errors.push_back("Expected root to be an array");
        return result;
    }
    if (!array_key.empty() && (!root.is_object() || !root.contains(array_key))) {
        result.errors.push_back("Missing key '" + array_key + "' in JSON");
        return result;
    }

    const nlohmann::json& entries = array_key.empty() ? root : root[array_key];
    if (!entries.is_array()) {
        result.errors.push_back("Key '" + array_key + "' is not an array");
        return result;
    }

    result.items.reserve(entries.size());
    for (const auto& entry : entries) {
        ++result.total_processed;
        if (!entry.is_object()) {
            result.errors.push_back("Entry " + std::to_string(result.total_processed) + " is not an object");
            continue;
        }

        std::string error;
        if (auto item = deserialize_fn(entry, error)) {
            result.items.push_back(std::move(*item));
        } else {
            result.errors.push_back(std::move(error));
        }
    }
    return result;
}

// ============================================================================
// Field readers - the default is returned when the key is absent or mistyped
// ============================================================================

namespace json_helpers {

inline std::string get_string(const nlohmann::json& j, const std::string& key, const std::string& def = "") {
    auto it = j.find(key);
    return it != j.end() && it->is_string() ? it->get<std::string>() : def;
}

inline int get_int(const nlohmann::json& j, const std::string& key, int def = 0) {
    auto it = j.find(key);
    return it != j.end() && it->is_number_integer() ? it->get<int>() : def;
}

inline float get_float(const nlohmann::json& j, const std::string& key, float def = 0.0f) {
    auto it = j.find(key);
    return it != j.end() && it->is_number() ? it->get<float>() : def;
}

// Non-numeric elements are skipped
inline std::vector<float> get_float_array(const nlohmann::json& j, const std::string& key) {
    std::vector<float> values;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return values;
    }
    for (const auto& element : *it) {
        if (element.is_number()) {
            values.push_back(element.get<float>());
        }
    }
    return values;
}

// False with a message when the key is missing or not a string
inline bool require_string(const nlohmann::json& j, const std::string& key, std::string& out_error) {
    auto it = j.find(key);
    if (it == j.end()) {
        out_error = "Missing required field '" + key + "'";
        return false;
    }
    if (!it->is_string()) {
        out_error = "Field '" + key + "' must be a string";
        return false;
    }
    return true;
}

} // namespace json_helpers

} // namespace anvil::data
