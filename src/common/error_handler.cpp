#include "error_handler.h"
#include "structured_logger.h"
#include <sstream>

namespace reprise {

SpecError::SpecError(const std::string& field, const std::string& constraint, const std::string& message)
    : RepriseException(ErrorInfo(ErrorType::SPEC_ERROR, ErrorSeverity::MEDIUM, message, constraint, field))
    , m_field(field)
    , m_constraint(constraint) {}

NotFoundError::NotFoundError(const std::string& ref, const std::string& message)
    : RepriseException(ErrorInfo(ErrorType::NOT_FOUND_ERROR, ErrorSeverity::HIGH, message, "", ref))
    , m_ref(ref) {}

ActionError::ActionError(const std::string& ref, const std::string& action, const std::string& message)
    : RepriseException(ErrorInfo(ErrorType::ACTION_ERROR, ErrorSeverity::HIGH, message, action, ref))
    , m_ref(ref)
    , m_action(action) {}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::handleError(const ErrorInfo& error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_errorHistory.push_back(error);
        if (m_errorHistory.size() > MAX_HISTORY) {
            m_errorHistory.erase(m_errorHistory.begin());
        }
    }
    logError(error);
}

void ErrorHandler::handleException(const std::exception& e, const std::string& context) {
    const RepriseException* repriseError = dynamic_cast<const RepriseException*>(&e);
    if (repriseError) {
        ErrorInfo error = repriseError->getErrorInfo();
        if (!context.empty()) {
            error.context = error.context.empty() ? context : context + ": " + error.context;
        }
        handleError(error);
    } else {
        handleError(ErrorInfo(ErrorType::UNKNOWN_ERROR, ErrorSeverity::HIGH, e.what(), "", context));
    }
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t start = (m_errorHistory.size() > count) ? m_errorHistory.size() - count : 0;
    return std::vector<ErrorInfo>(m_errorHistory.begin() + start, m_errorHistory.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errorHistory.clear();
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::ostringstream logMessage;
    logMessage << "[" << errorTypeToString(error.type) << "] " << error.message;
    if (!error.details.empty()) {
        logMessage << " - Details: " << error.details;
    }
    if (!error.context.empty()) {
        logMessage << " - Context: " << error.context;
    }

    const std::string typeName = errorTypeToString(error.type);
    const std::string severityName = errorSeverityToString(error.severity);

    switch (error.severity) {
        case ErrorSeverity::LOW:
            SLOG_DEBUG().message(logMessage.str()).context("error_type", typeName).context("severity", severityName);
            break;
        case ErrorSeverity::MEDIUM:
            SLOG_WARNING().message(logMessage.str()).context("error_type", typeName).context("severity", severityName);
            break;
        case ErrorSeverity::HIGH:
            SLOG_ERROR().message(logMessage.str()).context("error_type", typeName).context("severity", severityName);
            break;
        case ErrorSeverity::CRITICAL:
            SLOG_CRITICAL().message(logMessage.str()).context("error_type", typeName).context("severity", severityName);
            break;
    }
}

std::string ErrorHandler::errorTypeToString(ErrorType type) {
    switch (type) {
        case ErrorType::SPEC_ERROR: return "SPEC";
        case ErrorType::ACTION_ERROR: return "ACTION";
        case ErrorType::NOT_FOUND_ERROR: return "NOT_FOUND";
        case ErrorType::CONFIGURATION_ERROR: return "CONFIGURATION";
        case ErrorType::UNKNOWN_ERROR: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string ErrorHandler::errorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW: return "LOW";
        case ErrorSeverity::MEDIUM: return "MEDIUM";
        case ErrorSeverity::HIGH: return "HIGH";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

} // namespace reprise
