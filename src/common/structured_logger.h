#ifndef REPRISE_STRUCTURED_LOGGER_H
#define REPRISE_STRUCTURED_LOGGER_H

#include <string>
#include <memory>
#include <chrono>
#include <atomic>
#include <unordered_map>
#include <thread>
#include <mutex>
#include <vector>
#include <fstream>
#include <nlohmann/json.hpp>

// LogLevel enum for structured logging
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL,  // Avoids clashing with the Windows ERROR macro
    CRITICAL
};

namespace reprise {

/**
 * @brief One log record. @c context holds the structured key/value data.
 *
 * @c operation and @c duration are only set on performance entries.
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level = LogLevel::INFO;
    std::string message;
    std::string file;
    int line = 0;
    std::thread::id thread_id;
    nlohmann::json context;

    std::string operation;
    std::chrono::nanoseconds duration{0};
};

std::string logLevelToString(LogLevel level);
bool parseLogLevel(const std::string& name, LogLevel& out);

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogEntry& entry) = 0;
};

// One JSON object per line
class JsonLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

class TextLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Console log sink. Errors always go to stderr; with @p stderrOnly
 * everything does, leaving stdout to the program's own output.
 */
class ConsoleLogSink : public ILogSink {
public:
    explicit ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter, bool stderrOnly = false);
    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::shared_ptr<ILogFormatter> m_formatter;
    bool m_stderrOnly;
    std::mutex m_mutex;
};

/**
 * @brief Appends to @c base_path and rotates it once it reaches
 * @c max_file_size. Rotated files are named "<stem>.<n><ext>", newest first;
 * at most @c max_files files exist including the active one.
 */
class RotatingFileLogSink : public ILogSink {
public:
    struct Config {
        std::string base_path;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t max_files = 5;
    };

    RotatingFileLogSink(const Config& config, std::shared_ptr<ILogFormatter> formatter);

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    Config m_config;
    std::shared_ptr<ILogFormatter> m_formatter;
    std::ofstream m_file;
    size_t m_written;
    std::mutex m_mutex;

    void open();
    void rotate();
    std::string rotatedName(size_t index) const;
};

/**
 * @brief Per-operation duration statistics
 */
class PerformanceTracker {
public:
    struct MetricsSnapshot {
        uint64_t count = 0;
        uint64_t total_duration_ns = 0;
        uint64_t min_duration_ns = 0;
        uint64_t max_duration_ns = 0;
        uint64_t errors = 0;

        double getAverageDurationMs() const;
        nlohmann::json toJson() const;
    };

    void recordOperation(const std::string& operation,
                         std::chrono::nanoseconds duration,
                         bool success = true);

    // Zeroed snapshot for an operation never recorded
    MetricsSnapshot getMetrics(const std::string& operation) const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, MetricsSnapshot> m_metrics;
};

/**
 * @brief RAII performance timer
 *
 * Records its lifetime under @p operation_name when destroyed. Timers built
 * with @p warnIfSlow = false still record, but never raise the slow
 * operation warning; long-running loops use that. Call markFailed() before
 * destruction to count the operation as an error.
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name, bool warnIfSlow = true);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    void markFailed() { m_failed = true; }

private:
    std::string m_operation_name;
    std::chrono::steady_clock::time_point m_start;
    bool m_warnIfSlow;
    bool m_failed;
};

/**
 * @brief Process wide structured logger
 */
class StructuredLogger {
public:
    static StructuredLogger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void addSink(std::shared_ptr<ILogSink> sink);
    void clearSinks();

    void log(const LogEntry& entry);

    // Records the duration; with warnIfSlow, operations over the threshold are logged as WARNING
    void logPerformance(const std::string& operation,
                        std::chrono::nanoseconds duration,
                        bool success = true,
                        bool warnIfSlow = true);
    void setSlowOperationThreshold(std::chrono::milliseconds threshold);

    class LogBuilder {
    public:
        LogBuilder(StructuredLogger* logger, LogLevel level);
        LogBuilder(LogBuilder&& other) noexcept;
        LogBuilder(const LogBuilder&) = delete;
        LogBuilder& operator=(const LogBuilder&) = delete;

        LogBuilder& message(const std::string& msg);
        LogBuilder& context(const std::string& key, const nlohmann::json& value);
        LogBuilder& file(const char* file, int line);

        ~LogBuilder();  // Logs on destruction

    private:
        StructuredLogger* m_logger;
        LogEntry m_entry;
    };

    LogBuilder debug() { return LogBuilder(this, LogLevel::DEBUG); }
    LogBuilder info() { return LogBuilder(this, LogLevel::INFO); }
    LogBuilder warning() { return LogBuilder(this, LogLevel::WARNING); }
    LogBuilder error() { return LogBuilder(this, LogLevel::ERROR_LEVEL); }
    LogBuilder critical() { return LogBuilder(this, LogLevel::CRITICAL); }

    PerformanceTracker& getPerformanceTracker() { return m_performance_tracker; }

    void flush();

private:
    StructuredLogger();
    ~StructuredLogger();
    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    std::atomic<LogLevel> m_min_level;
    std::atomic<long long> m_slow_threshold_ms;
    std::vector<std::shared_ptr<ILogSink>> m_sinks;
    std::mutex m_sinks_mutex;

    PerformanceTracker m_performance_tracker;
};

#define SLOG_DEBUG() reprise::StructuredLogger::getInstance().debug().file(__FILE__, __LINE__)
#define SLOG_INFO() reprise::StructuredLogger::getInstance().info().file(__FILE__, __LINE__)
#define SLOG_WARNING() reprise::StructuredLogger::getInstance().warning().file(__FILE__, __LINE__)
#define SLOG_ERROR() reprise::StructuredLogger::getInstance().error().file(__FILE__, __LINE__)
#define SLOG_CRITICAL() reprise::StructuredLogger::getInstance().critical().file(__FILE__, __LINE__)

#define SCOPED_TIMER(operation) reprise::ScopedTimer _timer(operation)

} // namespace reprise

#endif // REPRISE_STRUCTURED_LOGGER_H
