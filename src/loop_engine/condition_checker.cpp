#include "condition_checker.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <stdexcept>

namespace reprise {

ConditionChecker::ConditionChecker(std::shared_ptr<IConditionEvaluator> evaluator)
    : m_evaluator(std::move(evaluator)) {
    if (!m_evaluator) {
        throw std::invalid_argument("ConditionChecker requires a condition evaluator");
    }
}

bool ConditionChecker::evaluate(const StopCondition& condition) {
    auto target = m_evaluator->locate(condition.target);
    if (!target) {
        throw NotFoundError(condition.target.ref, "Element not found for ref: " + condition.target.ref);
    }

    bool result = false;
    switch (condition.assertionType) {
        case AssertionType::TO_BE_VISIBLE:
            result = target->isVisible();
            break;
        case AssertionType::TO_BE_HIDDEN:
            result = target->isHidden();
            break;
        case AssertionType::TO_BE_ENABLED:
            result = target->isEnabled();
            break;
        case AssertionType::TO_BE_DISABLED:
            result = target->isDisabled();
            break;
    }

    bool met = condition.negate ? !result : result;
    SLOG_DEBUG().message("Stop condition evaluated")
        .context("assertion", toString(condition.assertionType))
        .context("negate", condition.negate)
        .context("met", met);
    return met;
}

} // namespace reprise
