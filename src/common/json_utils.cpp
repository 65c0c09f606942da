#include "json_utils.h"
#include "structured_logger.h"
#include <cstdint>
#include <limits>

namespace reprise {
namespace utils {

bool JsonUtils::validateJsonField(const nlohmann::json& json, const std::string& fieldName, const std::string& expectedType) {
    if (!json.is_object() || !json.contains(fieldName)) {
        return false;
    }

    const auto& field = json[fieldName];
    if (expectedType == "string") return field.is_string();
    if (expectedType == "integer") return field.is_number_integer();
    if (expectedType == "number") return field.is_number();
    if (expectedType == "boolean") return field.is_boolean();
    if (expectedType == "object") return field.is_object();
    if (expectedType == "array") return field.is_array();

    SLOG_WARNING().message("Unknown expected type in validateJsonField").context("expected_type", expectedType);
    return false;
}

const nlohmann::json* JsonUtils::findNestedField(const nlohmann::json& json, const std::string& path) {
    const nlohmann::json* current = &json;
    size_t start = 0;

    while (start <= path.size()) {
        size_t dot = path.find('.', start);
        std::string part = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

        if (part.empty() || !current->is_object() || !current->contains(part)) {
            return nullptr;
        }
        current = &(*current)[part];

        if (dot == std::string::npos) {
            return current;
        }
        start = dot + 1;
    }

    return nullptr;
}

std::string JsonUtils::getNestedStringField(const nlohmann::json& json, const std::string& path, const std::string& defaultValue) {
    const nlohmann::json* field = findNestedField(json, path);
    if (!field) {
        return defaultValue;
    }
    if (!field->is_string()) {
        SLOG_WARNING().message("Field is not a string, returning default value").context("field", path);
        return defaultValue;
    }
    return field->get<std::string>();
}

int JsonUtils::getNestedIntField(const nlohmann::json& json, const std::string& path, int defaultValue) {
    const nlohmann::json* field = findNestedField(json, path);
    if (!field) {
        return defaultValue;
    }
    if (!field->is_number_integer()) {
        SLOG_WARNING().message("Field is not an integer, returning default value").context("field", path);
        return defaultValue;
    }
    if (!fitsInt(*field)) {
        SLOG_WARNING().message("Integer field out of range, returning default value")
            .context("field", path)
            .context("value", *field);
        return defaultValue;
    }
    return field->get<int>();
}

bool JsonUtils::fitsInt(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    }
    if (!value.is_number_integer()) {
        return false;
    }
    const std::int64_t v = value.get<std::int64_t>();
    return v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
}

nlohmann::json JsonUtils::mergeJsonObjects(const nlohmann::json& base, const nlohmann::json& overlay) {
    if (!base.is_object() || !overlay.is_object()) {
        return overlay;
    }

    nlohmann::json result = base;
    for (const auto& [key, value] : overlay.items()) {
        if (result.contains(key)) {
            result[key] = mergeJsonObjects(result[key], value);
        } else {
            result[key] = value;
        }
    }
    return result;
}

std::string JsonUtils::jsonTypeToString(const nlohmann::json& json) {
    if (json.is_null()) return "null";
    if (json.is_boolean()) return "boolean";
    if (json.is_number_integer()) return "integer";
    if (json.is_number()) return "number";
    if (json.is_string()) return "string";
    if (json.is_array()) return "array";
    if (json.is_object()) return "object";
    return "unknown";
}

} // namespace utils
} // namespace reprise
