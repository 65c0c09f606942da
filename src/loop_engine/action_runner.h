#ifndef REPRISE_ACTION_RUNNER_H
#define REPRISE_ACTION_RUNNER_H

#include <memory>
#include "element_interfaces.h"

namespace reprise {

/**
 * @brief Performs one ActionSpec against an IActionExecutor
 */
class ActionRunner {
public:
    explicit ActionRunner(std::shared_ptr<IActionExecutor> executor);

    // Propagates SpecError, NotFoundError and ActionError unchanged
    void run(const ActionSpec& action);

private:
    std::shared_ptr<IActionExecutor> m_executor;
};

} // namespace reprise

#endif // REPRISE_ACTION_RUNNER_H
