#include "structured_logger.h"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <algorithm>
#include <ctime>

namespace reprise {

namespace fs = std::filesystem;

namespace {
    std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
        const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()).count() % 1000;

        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &seconds);
#else
        localtime_r(&seconds, &tm);
#endif
        std::ostringstream out;
        out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << millis;
        return out.str();
    }

    std::string sourceName(const LogEntry& entry) {
        return fs::path(entry.file).filename().string();
    }

    double toMs(std::chrono::nanoseconds ns) {
        return ns.count() / 1e6;
    }
}

std::string logLevelToString(::LogLevel level) {
    switch (level) {
        case ::LogLevel::DEBUG: return "DEBUG";
        case ::LogLevel::INFO: return "INFO";
        case ::LogLevel::WARNING: return "WARNING";
        case ::LogLevel::ERROR_LEVEL: return "ERROR";
        case ::LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

bool parseLogLevel(const std::string& name, ::LogLevel& out) {
    static const std::unordered_map<std::string, ::LogLevel> levels = {
        {"DEBUG", ::LogLevel::DEBUG},
        {"INFO", ::LogLevel::INFO},
        {"WARNING", ::LogLevel::WARNING},
        {"ERROR", ::LogLevel::ERROR_LEVEL},
        {"CRITICAL", ::LogLevel::CRITICAL}
    };
    auto it = levels.find(name);
    if (it == levels.end()) {
        return false;
    }
    out = it->second;
    return true;
}

// Formatters

std::string JsonLogFormatter::format(const LogEntry& entry) {
    std::ostringstream thread;
    thread << entry.thread_id;

    nlohmann::json record = {
        {"timestamp", formatTimestamp(entry.timestamp)},
        {"level", logLevelToString(entry.level)},
        {"message", entry.message},
        {"thread", thread.str()}
    };
    if (!entry.file.empty()) {
        record["source"] = {{"file", sourceName(entry)}, {"line", entry.line}};
    }
    if (!entry.operation.empty()) {
        record["operation"] = entry.operation;
        record["duration_ms"] = toMs(entry.duration);
    }
    if (!entry.context.empty()) {
        record["context"] = entry.context;
    }
    return record.dump() + "\n";
}

std::string TextLogFormatter::format(const LogEntry& entry) {
    std::ostringstream out;
    out << "[" << formatTimestamp(entry.timestamp) << "] "
        << "[" << std::setw(8) << logLevelToString(entry.level) << "] "
        << entry.message;

    if (!entry.file.empty() && entry.level >= ::LogLevel::ERROR_LEVEL) {
        out << " (" << sourceName(entry) << ":" << entry.line << ")";
    }
    if (!entry.operation.empty()) {
        out << " [" << entry.operation << ": " << std::fixed << std::setprecision(2)
            << toMs(entry.duration) << "ms]";
    }
    if (!entry.context.empty()) {
        out << " " << entry.context.dump();
    }
    out << "\n";
    return out.str();
}

// ConsoleLogSink

ConsoleLogSink::ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter, bool stderrOnly)
    : m_formatter(std::move(formatter)), m_stderrOnly(stderrOnly) {}

void ConsoleLogSink::write(const LogEntry& entry) {
    const std::string line = m_formatter->format(entry);
    std::lock_guard<std::mutex> lock(m_mutex);
    std::ostream& stream = (m_stderrOnly || entry.level >= ::LogLevel::ERROR_LEVEL) ? std::cerr : std::cout;
    stream << line;
}

void ConsoleLogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::cout.flush();
    std::cerr.flush();
}

// RotatingFileLogSink

RotatingFileLogSink::RotatingFileLogSink(const Config& config, std::shared_ptr<ILogFormatter> formatter)
    : m_config(config), m_formatter(std::move(formatter)), m_written(0) {
    open();
}

void RotatingFileLogSink::write(const LogEntry& entry) {
    const std::string line = m_formatter->format(entry);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_file.is_open()) {
        open();
    }
    m_file << line;
    m_written += line.size();

    if (m_written >= m_config.max_file_size) {
        rotate();
    }
}

void RotatingFileLogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.flush();
    }
}

void RotatingFileLogSink::open() {
    std::error_code ec;
    const fs::path parent = fs::path(m_config.base_path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    m_file.open(m_config.base_path, std::ios::app);
    const auto existing = fs::file_size(m_config.base_path, ec);
    m_written = ec ? 0 : static_cast<size_t>(existing);
}

void RotatingFileLogSink::rotate() {
    m_file.close();

    // Shift base -> .1 -> .2 ...; whatever lands past max_files - 1 is dropped
    std::error_code ec;
    const size_t keep = m_config.max_files > 0 ? m_config.max_files - 1 : 0;
    if (keep == 0) {
        fs::remove(m_config.base_path, ec);
    } else {
        fs::remove(rotatedName(keep), ec);
        for (size_t index = keep; index > 1; --index) {
            fs::rename(rotatedName(index - 1), rotatedName(index), ec);
        }
        fs::rename(m_config.base_path, rotatedName(1), ec);
    }

    open();
}

std::string RotatingFileLogSink::rotatedName(size_t index) const {
    const fs::path base(m_config.base_path);
    const std::string name = base.stem().string() + "." + std::to_string(index) + base.extension().string();
    return (base.parent_path() / name).string();
}

// PerformanceTracker

double PerformanceTracker::MetricsSnapshot::getAverageDurationMs() const {
    if (count == 0) return 0.0;
    return (total_duration_ns / count) / 1e6;
}

nlohmann::json PerformanceTracker::MetricsSnapshot::toJson() const {
    return nlohmann::json{
        {"count", count},
        {"errors", errors},
        {"average_ms", getAverageDurationMs()},
        {"min_ms", min_duration_ns / 1e6},
        {"max_ms", max_duration_ns / 1e6},
        {"total_ms", total_duration_ns / 1e6}
    };
}

void PerformanceTracker::recordOperation(const std::string& operation,
                                         std::chrono::nanoseconds duration,
                                         bool success) {
    const uint64_t ns = static_cast<uint64_t>(std::max<std::chrono::nanoseconds::rep>(duration.count(), 0));

    std::lock_guard<std::mutex> lock(m_mutex);
    MetricsSnapshot& metrics = m_metrics[operation];
    metrics.min_duration_ns = metrics.count == 0 ? ns : std::min(metrics.min_duration_ns, ns);
    metrics.max_duration_ns = std::max(metrics.max_duration_ns, ns);
    metrics.total_duration_ns += ns;
    metrics.count++;
    if (!success) {
        metrics.errors++;
    }
}

PerformanceTracker::MetricsSnapshot PerformanceTracker::getMetrics(const std::string& operation) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_metrics.find(operation);
    return it == m_metrics.end() ? MetricsSnapshot{} : it->second;
}

// ScopedTimer

ScopedTimer::ScopedTimer(const std::string& operation_name, bool warnIfSlow)
    : m_operation_name(operation_name)
    , m_start(std::chrono::steady_clock::now())
    , m_warnIfSlow(warnIfSlow)
    , m_failed(false) {}

ScopedTimer::~ScopedTimer() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - m_start);
    StructuredLogger::getInstance().logPerformance(m_operation_name, elapsed, !m_failed, m_warnIfSlow);
}

// StructuredLogger

StructuredLogger& StructuredLogger::getInstance() {
    static StructuredLogger instance;
    return instance;
}

StructuredLogger::StructuredLogger()
    : m_min_level(::LogLevel::INFO)
    , m_slow_threshold_ms(2000) {
    addSink(std::make_shared<ConsoleLogSink>(std::make_shared<TextLogFormatter>()));
}

StructuredLogger::~StructuredLogger() {
    flush();
}

void StructuredLogger::setLogLevel(::LogLevel level) {
    m_min_level = level;
}

::LogLevel StructuredLogger::getLogLevel() const {
    return m_min_level.load();
}

void StructuredLogger::addSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(m_sinks_mutex);
    m_sinks.push_back(std::move(sink));
}

void StructuredLogger::clearSinks() {
    std::lock_guard<std::mutex> lock(m_sinks_mutex);
    m_sinks.clear();
}

void StructuredLogger::log(const LogEntry& entry) {
    if (entry.level < m_min_level.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_sinks_mutex);
    for (const auto& sink : m_sinks) {
        sink->write(entry);
    }
}

void StructuredLogger::logPerformance(const std::string& operation,
                                      std::chrono::nanoseconds duration,
                                      bool success,
                                      bool warnIfSlow) {
    m_performance_tracker.recordOperation(operation, duration, success);

    if (!warnIfSlow || duration <= std::chrono::milliseconds(m_slow_threshold_ms.load())) {
        return;
    }

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = ::LogLevel::WARNING;
    entry.message = "Slow operation detected";
    entry.thread_id = std::this_thread::get_id();
    entry.operation = operation;
    entry.duration = duration;
    entry.context["threshold_ms"] = m_slow_threshold_ms.load();
    log(entry);
}

void StructuredLogger::setSlowOperationThreshold(std::chrono::milliseconds threshold) {
    m_slow_threshold_ms = threshold.count();
}

void StructuredLogger::flush() {
    std::lock_guard<std::mutex> lock(m_sinks_mutex);
    for (const auto& sink : m_sinks) {
        sink->flush();
    }
}

// LogBuilder

StructuredLogger::LogBuilder::LogBuilder(StructuredLogger* logger, ::LogLevel level)
    : m_logger(logger) {
    m_entry.level = level;
    m_entry.timestamp = std::chrono::system_clock::now();
    m_entry.thread_id = std::this_thread::get_id();
}

StructuredLogger::LogBuilder::LogBuilder(LogBuilder&& other) noexcept
    : m_logger(other.m_logger)
    , m_entry(std::move(other.m_entry)) {
    other.m_logger = nullptr;
}

StructuredLogger::LogBuilder& StructuredLogger::LogBuilder::message(const std::string& msg) {
    m_entry.message = msg;
    return *this;
}

StructuredLogger::LogBuilder& StructuredLogger::LogBuilder::context(const std::string& key,
                                                                    const nlohmann::json& value) {
    m_entry.context[key] = value;
    return *this;
}

StructuredLogger::LogBuilder& StructuredLogger::LogBuilder::file(const char* file, int line) {
    m_entry.file = file;
    m_entry.line = line;
    return *this;
}

StructuredLogger::LogBuilder::~LogBuilder() {
    if (m_logger) {
        m_logger->log(m_entry);
    }
}

} // namespace reprise
