#include "action_runner.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <stdexcept>

namespace reprise {

ActionRunner::ActionRunner(std::shared_ptr<IActionExecutor> executor)
    : m_executor(std::move(executor)) {
    if (!m_executor) {
        throw std::invalid_argument("ActionRunner requires an action executor");
    }
}

void ActionRunner::run(const ActionSpec& action) {
    // A missing value must fail before the element is touched.
    action.validate();

    auto target = m_executor->locate(action.target);
    if (!target) {
        throw NotFoundError(action.target.ref, "Element not found for ref: " + action.target.ref);
    }

    switch (action.type) {
        case ActionType::CLICK:
            target->click();
            break;
        case ActionType::HOVER:
            target->hover();
            break;
        case ActionType::FILL:
            target->fill(*action.value);
            break;
        case ActionType::PRESS:
            target->press(*action.value);
            break;
    }

    SLOG_DEBUG().message("Action performed")
        .context("type", toString(action.type))
        .context("ref", action.target.ref);
}

} // namespace reprise
