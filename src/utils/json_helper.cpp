#include "mirror_for_plex/utils/json_helper.hpp"

namespace mirror_for_plex::utils {

std::expected<nlohmann::json, std::string> JsonHelper::safe_parse(const std::string& json_string) {
    if (json_string.empty()) {
        return std::unexpected("Empty JSON string");
    }

    // Plex answers with XML when the Accept header is ignored
    if (json_string[0] == '<') {
        return std::unexpected("Response appears to be XML/HTML, not JSON");
    }

    try {
        return nlohmann::json::parse(json_string);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected("JSON parse error: " + std::string(e.what()));
    }
}

std::string JsonHelper::get_string(const nlohmann::json& json, const std::string& field,
                                   const std::string& default_value) {
    if (!has_field(json, field) || !json[field].is_string()) {
        return default_value;
    }
    return json[field].get<std::string>();
}

std::vector<std::string> JsonHelper::get_string_list(const nlohmann::json& json, const std::string& field) {
    std::vector<std::string> values;
    if (!has_array(json, field)) {
        return values;
    }

    for (const auto& element : json[field]) {
        if (element.is_string()) {
            auto value = element.get<std::string>();
            if (!value.empty()) {
                values.push_back(std::move(value));
            }
        }
    }
    return values;
}

std::string JsonHelper::get_id(const nlohmann::json& json, const std::string& field) {
    if (!has_field(json, field)) {
        return {};
    }

    const auto& value = json[field];
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return {};
}

bool JsonHelper::has_field(const nlohmann::json& json, const std::string& field) {
    return json.is_object() && json.contains(field) && !json[field].is_null();
}

bool JsonHelper::has_array(const nlohmann::json& json, const std::string& field) {
    return json.is_object() && json.contains(field) && json[field].is_array() && !json[field].empty();
}

} // namespace mirror_for_plex::utils
