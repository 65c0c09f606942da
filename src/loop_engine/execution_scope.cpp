#include "execution_scope.h"
#include "../common/structured_logger.h"

namespace reprise {

ExecutionScope::ExecutionScope(std::shared_ptr<IExecutionHost> host, const std::string& operation)
    : m_host(std::move(host))
    , m_operation(operation)
    , m_active(false) {
    if (m_host) {
        m_host->beginExclusive(m_operation);
        m_active = true;
        SLOG_DEBUG().message("Exclusive section opened").context("operation", m_operation);
    }
}

ExecutionScope::~ExecutionScope() {
    release();
}

void ExecutionScope::release() noexcept {
    if (!m_active) {
        return;
    }
    m_active = false;
    m_host->endExclusive(m_operation);
}

} // namespace reprise
