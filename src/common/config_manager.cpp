#include "config_manager.h"
#include "structured_logger.h"
#include "error_handler.h"
#include "file_utils.h"
#include "json_utils.h"

namespace reprise {

namespace {
    // Shared with the host's "element attached" wait.
    constexpr int ELEMENT_ATTACHED_TIMEOUT_MS = 5000;
}

ConfigManager::ConfigManager()
    : m_config(defaults()) {
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

nlohmann::json ConfigManager::defaults() {
    return nlohmann::json{
        {"loop", {
            {"default_max_iterations", 20},
            {"for_delay_ms", 300},
            {"conditional_delay_ms", 100},
            {"element_attached_timeout_ms", ELEMENT_ATTACHED_TIMEOUT_MS}
        }},
        {"logging", {
            {"level", "INFO"},
            {"file", "logs/reprise.log"},
            {"max_size_mb", 10},
            {"max_files", 5},
            {"format", "text"},
            {"slow_operation_ms", 2000}
        }}
    };
}

bool ConfigManager::loadConfig(const std::string& configPath) {
    SCOPED_TIMER("config.load");
    nlohmann::json loaded;
    bool exists = utils::FileUtils::fileExists(configPath);

    if (exists && !utils::FileUtils::loadJsonFromFile(configPath, loaded)) {
        ErrorHandler::getInstance().handleError(ErrorInfo(
            ErrorType::CONFIGURATION_ERROR, ErrorSeverity::MEDIUM,
            "Failed to load config, using defaults", "", configPath));
        resetToDefaults();
        return false;
    }

    if (exists && !loaded.is_object()) {
        ErrorHandler::getInstance().handleError(ErrorInfo(
            ErrorType::CONFIGURATION_ERROR, ErrorSeverity::MEDIUM,
            "Config root must be an object, using defaults", utils::JsonUtils::jsonTypeToString(loaded), configPath));
        resetToDefaults();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_configPath = configPath;
        m_config = exists ? utils::JsonUtils::mergeJsonObjects(defaults(), loaded) : defaults();
    }

    if (exists) {
        SLOG_INFO().message("Configuration loaded").context("config_path", configPath);
        return true;
    }

    SLOG_WARNING().message("Config file not found, writing defaults").context("config_path", configPath);
    return saveConfig(configPath);
}

bool ConfigManager::saveConfig(const std::string& configPath) const {
    nlohmann::json snapshot = toJson();
    if (!utils::FileUtils::saveJsonToFile(configPath, snapshot)) {
        SLOG_ERROR().message("Failed to save configuration").context("config_path", configPath);
        return false;
    }
    SLOG_INFO().message("Configuration saved").context("config_path", configPath);
    return true;
}

void ConfigManager::loadConfigFromJson(const nlohmann::json& overrides) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = utils::JsonUtils::mergeJsonObjects(defaults(), overrides);
}

void ConfigManager::resetToDefaults() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = defaults();
}

int ConfigManager::getBoundedInt(const std::string& path, int minimum) const {
    const int fallback = utils::JsonUtils::getNestedIntField(defaults(), path);

    nlohmann::json raw;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const nlohmann::json* field = utils::JsonUtils::findNestedField(m_config, path);
        if (field) {
            raw = *field;
        }
    }

    if (raw.is_null()) {
        return fallback;
    }

    if (!utils::JsonUtils::fitsInt(raw)) {
        ErrorHandler::getInstance().handleError(ErrorInfo(
            ErrorType::CONFIGURATION_ERROR, ErrorSeverity::LOW,
            "Configuration value is not an int, using default", raw.dump(), path));
        return fallback;
    }

    const int value = raw.get<int>();
    if (value < minimum) {
        ErrorHandler::getInstance().handleError(ErrorInfo(
            ErrorType::CONFIGURATION_ERROR, ErrorSeverity::LOW,
            "Configuration value below minimum, using default",
            "minimum " + std::to_string(minimum) + ", got " + std::to_string(value), path));
        return fallback;
    }
    return value;
}

// Loop Configuration
int ConfigManager::getDefaultMaxIterations() const {
    return getBoundedInt("loop.default_max_iterations", 1);
}

int ConfigManager::getForDelayMs() const {
    return getBoundedInt("loop.for_delay_ms", 0);
}

int ConfigManager::getConditionalDelayMs() const {
    return getBoundedInt("loop.conditional_delay_ms", 0);
}

int ConfigManager::getElementAttachedTimeoutMs() const {
    return getBoundedInt("loop.element_attached_timeout_ms", 0);
}

// Logging Configuration
std::string ConfigManager::getLogFile() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return utils::JsonUtils::getNestedStringField(m_config, "logging.file", "logs/reprise.log");
}

std::string ConfigManager::getLogLevel() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return utils::JsonUtils::getNestedStringField(m_config, "logging.level", "INFO");
}

int ConfigManager::getLogMaxSizeMb() const {
    return getBoundedInt("logging.max_size_mb", 1);
}

int ConfigManager::getLogMaxFiles() const {
    return getBoundedInt("logging.max_files", 1);
}

std::string ConfigManager::getLogFormat() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return utils::JsonUtils::getNestedStringField(m_config, "logging.format", "text");
}

int ConfigManager::getSlowOperationMs() const {
    return getBoundedInt("logging.slow_operation_ms", 0);
}

std::string ConfigManager::getConfigPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configPath;
}

nlohmann::json ConfigManager::toJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

} // namespace reprise
