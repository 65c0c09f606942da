#ifndef REPRISE_ERROR_HANDLER_H
#define REPRISE_ERROR_HANDLER_H

#include <string>
#include <exception>
#include <mutex>
#include <vector>
#include <chrono>

namespace reprise {

enum class ErrorType {
    SPEC_ERROR,
    ACTION_ERROR,
    NOT_FOUND_ERROR,
    CONFIGURATION_ERROR,
    UNKNOWN_ERROR
};

enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

struct ErrorInfo {
    ErrorType type;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::system_clock::time_point timestamp;

    ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "")
        : type(t), severity(s), message(msg), details(det), context(ctx),
          timestamp(std::chrono::system_clock::now()) {}
};

class RepriseException : public std::exception {
public:
    explicit RepriseException(const ErrorInfo& error) : m_errorInfo(error) {}

    const char* what() const noexcept override {
        return m_errorInfo.message.c_str();
    }

    const ErrorInfo& getErrorInfo() const { return m_errorInfo; }

private:
    ErrorInfo m_errorInfo;
};

/**
 * @brief Structurally invalid loop or action specification.
 *
 * Raised before any iteration runs. @c field is the JSON path of the
 * offending parameter (e.g. "loop.iterations"), @c constraint names the
 * rule it broke ("required", "unsupported", "positive", ...).
 */
class SpecError : public RepriseException {
public:
    SpecError(const std::string& field, const std::string& constraint, const std::string& message);

    const std::string& field() const { return m_field; }
    const std::string& constraint() const { return m_constraint; }

private:
    std::string m_field;
    std::string m_constraint;
};

/**
 * @brief An element reference could not be resolved to an element.
 */
class NotFoundError : public RepriseException {
public:
    NotFoundError(const std::string& ref, const std::string& message);

    const std::string& ref() const { return m_ref; }

private:
    std::string m_ref;
};

/**
 * @brief Interaction with a resolved element failed (e.g. not interactable).
 */
class ActionError : public RepriseException {
public:
    ActionError(const std::string& ref, const std::string& action, const std::string& message);

    const std::string& ref() const { return m_ref; }
    const std::string& action() const { return m_action; }

private:
    std::string m_ref;
    std::string m_action;
};

/**
 * @brief Records failures for later inspection and logs them by severity.
 *
 * Nothing here retries or recovers: the caller still propagates the error.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void handleError(const ErrorInfo& error);
    void handleException(const std::exception& e, const std::string& context = "");

    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

    static std::string errorTypeToString(ErrorType type);
    static std::string errorSeverityToString(ErrorSeverity severity);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    mutable std::mutex m_mutex;
    std::vector<ErrorInfo> m_errorHistory;
    static constexpr size_t MAX_HISTORY = 1000;

    void logError(const ErrorInfo& error);
};

} // namespace reprise

#endif // REPRISE_ERROR_HANDLER_H
