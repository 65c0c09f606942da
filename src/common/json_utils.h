#ifndef REPRISE_JSON_UTILS_H
#define REPRISE_JSON_UTILS_H

#include <string>
#include <nlohmann/json.hpp>

namespace reprise {
namespace utils {

/**
 * @brief JSON helpers shared by request parsing and configuration
 */
class JsonUtils {
public:
    /**
     * @brief Check that @p json has @p fieldName with the expected JSON type
     * @param expectedType One of "string", "integer", "number", "boolean", "object", "array"
     */
    static bool validateJsonField(const nlohmann::json& json, const std::string& fieldName, const std::string& expectedType);

    /**
     * @brief Resolve a dot separated path ("loop.for_delay_ms")
     * @return Pointer into @p json, or nullptr when any segment is missing
     */
    static const nlohmann::json* findNestedField(const nlohmann::json& json, const std::string& path);

    static std::string getNestedStringField(const nlohmann::json& json, const std::string& path, const std::string& defaultValue = "");
    // Non-integers and values outside the int range yield defaultValue
    static int getNestedIntField(const nlohmann::json& json, const std::string& path, int defaultValue = 0);

    // True for a JSON integer representable as int
    static bool fitsInt(const nlohmann::json& value);

    /**
     * @brief Recursively merge @p overlay onto @p base
     * @note Objects merge key by key; any other overlay value replaces the base value
     */
    static nlohmann::json mergeJsonObjects(const nlohmann::json& base, const nlohmann::json& overlay);

    static std::string jsonTypeToString(const nlohmann::json& json);
};

} // namespace utils
} // namespace reprise

#endif // REPRISE_JSON_UTILS_H
