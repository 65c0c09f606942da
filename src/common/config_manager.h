#ifndef REPRISE_CONFIG_MANAGER_H
#define REPRISE_CONFIG_MANAGER_H

#include <string>
#include <mutex>
#include <nlohmann/json.hpp>

namespace reprise {

class ConfigManager {
public:
    static ConfigManager& getInstance();

    // Values in the file overlay the defaults. A missing file is written out with defaults.
    bool loadConfig(const std::string& configPath = "config/reprise.json");
    bool saveConfig(const std::string& configPath = "config/reprise.json") const;
    void loadConfigFromJson(const nlohmann::json& overrides);
    void resetToDefaults();

    // Loop Configuration
    int getDefaultMaxIterations() const;
    int getForDelayMs() const;
    int getConditionalDelayMs() const;
    int getElementAttachedTimeoutMs() const;

    // Logging Configuration
    std::string getLogFile() const;
    std::string getLogLevel() const;
    int getLogMaxSizeMb() const;
    int getLogMaxFiles() const;
    std::string getLogFormat() const;
    int getSlowOperationMs() const;

    std::string getConfigPath() const;
    nlohmann::json toJson() const;

private:
    ConfigManager();
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    mutable std::mutex m_mutex;
    nlohmann::json m_config;
    std::string m_configPath;

    static nlohmann::json defaults();
    int getBoundedInt(const std::string& path, int minimum) const;
};

} // namespace reprise

#endif // REPRISE_CONFIG_MANAGER_H
