#ifndef REPRISE_FILE_UTILS_H
#define REPRISE_FILE_UTILS_H

#include <string>
#include <nlohmann/json.hpp>

namespace reprise {
namespace utils {

/**
 * @brief JSON file I/O used by configuration and the CLI
 */
class FileUtils {
public:
    /**
     * @brief Load and parse a JSON document
     * @param filePath Path to JSON file (must not be empty)
     * @param jsonOutput Receives the parsed document
     * @return true if the file exists and parsed, false otherwise
     */
    static bool loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput);

    /**
     * @brief Write JSON through a temporary file and rename it into place
     * @return true if successful, false otherwise
     * @note Creates parent directories as needed
     */
    static bool saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData);

    static bool fileExists(const std::string& filePath);

private:
    static bool validateFilePath(const std::string& filePath);
    static bool ensureParentDirectoryExists(const std::string& filePath);
};

} // namespace utils
} // namespace reprise

#endif // REPRISE_FILE_UTILS_H
