#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include "common/config_manager.h"
#include "common/error_handler.h"
#include "common/file_utils.h"
#include "common/structured_logger.h"
#include "loop_engine/loop_spec.h"
#include "tool/repeat_action_tool.h"

using namespace reprise;

namespace {

void printUsage() {
    std::cout << "Usage: reprise_cli [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>       Configuration file (default: config/reprise.json)\n"
              << "  --validate <path>     Validate a repeat_action request and print it with effective limits\n"
              << "  --describe            Print the repeat_action tool metadata\n"
              << "  --version, -v         Print version\n"
              << "  --help, -h            Show this help\n";
}

void configureLogging(const ConfigManager& config) {
    auto& slogger = StructuredLogger::getInstance();

    ::LogLevel logLevel = ::LogLevel::INFO;
    if (!parseLogLevel(config.getLogLevel(), logLevel)) {
        std::cerr << "Warning: unknown log level '" << config.getLogLevel() << "', using INFO\n";
    }
    slogger.setLogLevel(logLevel);
    slogger.setSlowOperationThreshold(std::chrono::milliseconds(config.getSlowOperationMs()));

    std::shared_ptr<ILogFormatter> formatter;
    if (config.getLogFormat() == "json") {
        formatter = std::make_shared<JsonLogFormatter>();
    } else {
        formatter = std::make_shared<TextLogFormatter>();
    }

    RotatingFileLogSink::Config fileConfig;
    fileConfig.base_path = config.getLogFile();
    fileConfig.max_file_size = static_cast<size_t>(config.getLogMaxSizeMb()) * 1024 * 1024;
    fileConfig.max_files = static_cast<size_t>(config.getLogMaxFiles());

    // stdout carries the command's result
    slogger.clearSinks();
    slogger.addSink(std::make_shared<ConsoleLogSink>(std::make_shared<TextLogFormatter>(), true));
    slogger.addSink(std::make_shared<RotatingFileLogSink>(fileConfig, formatter));

    SLOG_INFO().message("Structured logging configured")
        .context("log_level", config.getLogLevel())
        .context("log_file", config.getLogFile());
}

int validateRequest(const std::string& requestPath, const ConfigManager& config) {
    nlohmann::json params;
    if (!utils::FileUtils::loadJsonFromFile(requestPath, params)) {
        std::cerr << "Error: cannot read request JSON from " << requestPath << "\n";
        return 1;
    }

    try {
        RepeatActionRequest request = RepeatActionRequest::fromJson(params);

        nlohmann::json output;
        output["request"] = request.toJson();
        output["effective"] = {
            {"maxIterations", request.limits.effectiveMaxIterations(config.getDefaultMaxIterations())},
            {"forDelayMs", config.getForDelayMs()},
            {"conditionalDelayMs", config.getConditionalDelayMs()},
            {"timeoutMs", config.getElementAttachedTimeoutMs()}
        };
        std::cout << output.dump(2) << "\n";
        return 0;
    } catch (const SpecError& e) {
        ErrorHandler::getInstance().handleException(e, requestPath);
        nlohmann::json error = {
            {"error", e.what()},
            {"field", e.field()},
            {"constraint", e.constraint()}
        };
        std::cout << error.dump(2) << "\n";
        return 2;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "config/reprise.json";
    std::string requestPath;
    bool describe = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "reprise_cli v0.1.0\n";
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config option requires a path argument\n";
                return 1;
            }
            configPath = argv[++i];
        } else if (arg == "--validate") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --validate option requires a path argument\n";
                return 1;
            }
            requestPath = argv[++i];
        } else if (arg == "--describe") {
            describe = true;
        } else {
            std::cerr << "Error: unknown option " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    // Until the configured sinks are in place, only warnings and up reach stderr.
    auto& slogger = StructuredLogger::getInstance();
    slogger.clearSinks();
    slogger.addSink(std::make_shared<ConsoleLogSink>(std::make_shared<TextLogFormatter>(), true));
    slogger.setLogLevel(::LogLevel::WARNING);

    int exitCode = 1;
    try {
        auto& config = ConfigManager::getInstance();
        if (!config.loadConfig(configPath)) {
            std::cerr << "Warning: using default configuration\n";
        }
        configureLogging(config);

        if (describe) {
            std::cout << RepeatActionTool::describe().dump(2) << "\n";
            exitCode = 0;
        } else if (!requestPath.empty()) {
            exitCode = validateRequest(requestPath, config);
        } else {
            printUsage();
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        exitCode = 1;
    }

    SLOG_DEBUG().message("Session metrics")
        .context("config.load", slogger.getPerformanceTracker().getMetrics("config.load").toJson())
        .context("exit_code", exitCode);
    slogger.flush();
    return exitCode;
}
