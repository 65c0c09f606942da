#ifndef REPRISE_EXECUTION_SCOPE_H
#define REPRISE_EXECUTION_SCOPE_H

#include <memory>
#include <string>

namespace reprise {

/**
 * @brief The tab or session that hosts a tool run
 *
 * While an exclusive section is open no other operation may interleave
 * with the tool's element interactions.
 */
class IExecutionHost {
public:
    virtual ~IExecutionHost() = default;

    virtual void beginExclusive(const std::string& operation) = 0;
    virtual void endExclusive(const std::string& operation) noexcept = 0;
};

/**
 * @brief RAII exclusive section on an IExecutionHost
 *
 * Opened in the constructor and closed in the destructor, so the section
 * ends on normal return, bound-exceeded termination and exceptions alike.
 * A null host makes the scope a no-op.
 */
class ExecutionScope {
public:
    ExecutionScope(std::shared_ptr<IExecutionHost> host, const std::string& operation);
    ~ExecutionScope();

    ExecutionScope(const ExecutionScope&) = delete;
    ExecutionScope& operator=(const ExecutionScope&) = delete;

    void release() noexcept;

    bool isActive() const noexcept {
        return m_active;
    }

private:
    std::shared_ptr<IExecutionHost> m_host;
    std::string m_operation;
    bool m_active;
};

} // namespace reprise

#endif // REPRISE_EXECUTION_SCOPE_H
