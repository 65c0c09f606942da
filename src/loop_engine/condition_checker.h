#ifndef REPRISE_CONDITION_CHECKER_H
#define REPRISE_CONDITION_CHECKER_H

#include <memory>
#include "element_interfaces.h"

namespace reprise {

/**
 * @brief Evaluates a StopCondition, applying its negate flag
 */
class ConditionChecker {
public:
    explicit ConditionChecker(std::shared_ptr<IConditionEvaluator> evaluator);

    bool evaluate(const StopCondition& condition);

private:
    std::shared_ptr<IConditionEvaluator> m_evaluator;
};

} // namespace reprise

#endif // REPRISE_CONDITION_CHECKER_H
