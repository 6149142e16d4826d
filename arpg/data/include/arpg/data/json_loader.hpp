#pragma once

#include <arpg/core/log.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <fstream>

namespace arpg::data {

// ============================================================================
// LoadResult - Result of a JSON loading operation
// ============================================================================

template<typename T>
struct LoadResult {
    std::vector<T> items;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    size_t total_processed = 0;

    bool success() const { return errors.empty(); }
    size_t loaded_count() const { return items.size(); }
    size_t error_count() const { return errors.size(); }
};

// ============================================================================
// Files
// ============================================================================

// Load and parse a JSON file, nullopt on failure
inline std::optional<nlohmann::json> load_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        core::log(core::LogLevel::Error, "[JsonLoader] Failed to open file: {}", path);
        return std::nullopt;
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        core::log(core::LogLevel::Error, "[JsonLoader] Parse error in {}: {}", path, e.what());
        return std::nullopt;
    }
}

// ============================================================================
// read_json_array - Deserialize an array of objects
// ============================================================================

// Deserializer signature:
// std::optional<T> deserialize(const nlohmann::json& obj, std::string& out_error)
// Empty array_key means the root itself is the array.
template<typename T, typename Deserializer>
LoadResult<T> read_json_array(const nlohmann::json& root,
                              Deserializer deserialize_fn,
                              const std::string& array_key = "") {
    LoadResult<T> result;

    const nlohmann::json* arr = nullptr;
    if (array_key.empty()) {
        if (!root.is_array()) {
            result.errors.push_back("Expected root to be an array");
            return result;
        }
        arr = &root;
    } else {
        if (!root.is_object() || !root.contains(array_key)) {
            result.errors.push_back("Missing key '" + array_key + "' in JSON");
            return result;
        }
        if (!root[array_key].is_array()) {
            result.errors.push_back("Key '" + array_key + "' is not an array");
            return result;
        }
        arr = &root[array_key];
    }

    result.items.reserve(arr->size());
    size_t index = 0;

    for (const auto& item : *arr) {
        ++result.total_processed;

        if (!item.is_object()) {
            result.warnings.push_back("Item at index " + std::to_string(index) + " is not an object, skipping");
            ++index;
            continue;
        }

        std::string error;
        auto obj_opt = deserialize_fn(item, error);

        if (obj_opt) {
            result.items.push_back(std::move(*obj_opt));
        } else {
            result.errors.push_back("Item " + std::to_string(index) + ": " + error);
        }

        ++index;
    }

    return result;
}

// Log a finished load under a category tag
template<typename T>
void log_load_result(const LoadResult<T>& result, const std::string& origin, const std::string& log_category) {
    for (const auto& warn : result.warnings) {
        core::log(core::LogLevel::Warn, "[{}] {}", log_category, warn);
    }
    for (const auto& err : result.errors) {
        core::log(core::LogLevel::Error, "[{}] {}", log_category, err);
    }
    core::log(core::LogLevel::Info, "[{}] Loaded {} items from {} ({} errors)",
              log_category, result.loaded_count(), origin, result.error_count());
}

// ============================================================================
// JSON Value Helpers - Safe extraction with defaults
// ============================================================================

namespace json_helpers {

inline std::string get_string(const nlohmann::json& j, const std::string& key, const std::string& def = "") {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return def;
}

inline int get_int(const nlohmann::json& j, const std::string& key, int def = 0) {
    if (j.contains(key) && j[key].is_number_integer()) {
        return j[key].get<int>();
    }
    return def;
}

inline float get_float(const nlohmann::json& j, const std::string& key, float def = 0.0f) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<float>();
    }
    return def;
}

inline double get_double(const nlohmann::json& j, const std::string& key, double def = 0.0) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return def;
}

inline std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            if (item.is_string()) {
                result.push_back(item.get<std::string>());
            }
        }
    }
    return result;
}

// Check if required field exists and is correct type
inline bool require_string(const nlohmann::json& j, const std::string& key, std::string& out_error) {
    if (!j.contains(key)) {
        out_error = "Missing required field '" + key + "'";
        return false;
    }
    if (!j[key].is_string()) {
        out_error = "Field '" + key + "' must be a string";
        return false;
    }
    return true;
}

inline bool require_number(const nlohmann::json& j, const std::string& key, std::string& out_error) {
    if (!j.contains(key)) {
        out_error = "Missing required field '" + key + "'";
        return false;
    }
    if (!j[key].is_number()) {
        out_error = "Field '" + key + "' must be a number";
        return false;
    }
    return true;
}

} // namespace json_helpers

} // namespace arpg::data
