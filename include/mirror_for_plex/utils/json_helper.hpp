#pragma once

#include <nlohmann/json.hpp>
#include <expected>
#include <string>
#include <vector>

namespace mirror_for_plex::utils {

/**
 * @brief Helper utilities for safe JSON parsing and field extraction
 *
 * Catalog and media server responses are loosely typed: fields may be
 * missing, null, or of an unexpected type. Every accessor here tolerates
 * that and falls back instead of throwing.
 */
class JsonHelper {
public:
    /**
     * @brief Safely parse a JSON string
     *
     * @param json_string The JSON string to parse
     * @return Parsed JSON or an error message
     */
    static std::expected<nlohmann::json, std::string> safe_parse(const std::string& json_string);

    /**
     * @brief Get a required field from JSON, returning error if missing
     */
    template<typename T>
    static std::expected<T, std::string> get_required(const nlohmann::json& json, const std::string& field);

    /**
     * @brief Get an optional field with a default for missing, null or mistyped values
     */
    template<typename T>
    static T get_optional(const nlohmann::json& json, const std::string& field, const T& default_value);

    /**
     * @brief String field, or the default when missing or null
     */
    static std::string get_string(const nlohmann::json& json, const std::string& field,
                                  const std::string& default_value = {});

    /**
     * @brief Collect the non-empty strings of an array field, skipping other element types
     */
    static std::vector<std::string> get_string_list(const nlohmann::json& json, const std::string& field);

    /**
     * @brief Identifier field as a string, whether the server sent a number or a string
     */
    static std::string get_id(const nlohmann::json& json, const std::string& field);

    static bool has_field(const nlohmann::json& json, const std::string& field);

    static bool has_array(const nlohmann::json& json, const std::string& field);
};

// Template implementations
template<typename T>
std::expected<T, std::string> JsonHelper::get_required(const nlohmann::json& json, const std::string& field) {
    if (!json.is_object() || !json.contains(field)) {
        return std::unexpected("Missing required field: " + field);
    }

    try {
        return json[field].get<T>();
    } catch (const std::exception& e) {
        return std::unexpected("Failed to extract field '" + field + "': " + e.what());
    }
}

template<typename T>
T JsonHelper::get_optional(const nlohmann::json& json, const std::string& field, const T& default_value) {
    if (!has_field(json, field)) {
        return default_value;
    }

    try {
        return json[field].get<T>();
    } catch (const std::exception&) {
        return default_value;
    }
}

} // namespace mirror_for_plex::utils
