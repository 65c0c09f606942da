#ifndef REPRISE_LOOP_CONTROLLER_H
#define REPRISE_LOOP_CONTROLLER_H

#include <chrono>
#include <memory>
#include <vector>
#include "action_runner.h"
#include "condition_checker.h"
#include "evidence_recorder.h"

namespace reprise {

struct LoopTiming {
    int forDelayMs;          // Pause after each for-loop action
    int conditionalDelayMs;  // Pause after each while/do-while action
    int timeoutMs;           // Wall-clock bound for while/do-while

    LoopTiming() : forDelayMs(300), conditionalDelayMs(100), timeoutMs(5000) {}
};

struct LoopOutcome {
    int iterations;
    std::vector<IterationRecord> evidence;
    StopReason stopReason;
    long long elapsedMs;

    LoopOutcome() : iterations(0), stopReason(StopReason::COMPLETED), elapsedMs(0) {}
};

/**
 * @class LoopController
 * @brief Drives one action under a for, while or do-while discipline
 *
 * Iterations run strictly one after another on the calling thread.
 * Reaching the stop condition, the iteration cap or the timeout is normal
 * termination and yields a LoopOutcome. Only a malformed spec (SpecError)
 * or a collaborator failure (NotFoundError, ActionError) escapes as an
 * exception; the failed iteration is not recorded.
 */
class LoopController {
public:
    LoopController(std::shared_ptr<IActionExecutor> executor,
                   std::shared_ptr<IConditionEvaluator> evaluator);

    void setTiming(const LoopTiming& timing);
    const LoopTiming& getTiming() const { return m_timing; }

    // Used when Limits carries no maxIterations
    void setDefaultMaxIterations(int maxIterations);
    int getDefaultMaxIterations() const { return m_defaultMaxIterations; }

    LoopOutcome run(const LoopSpec& loop, const ActionSpec& action, const Limits& limits = Limits());

private:
    using Clock = std::chrono::steady_clock;

    ActionRunner m_actionRunner;
    ConditionChecker m_conditionChecker;
    LoopTiming m_timing;
    int m_defaultMaxIterations;

    StopReason runFor(int iterations, const ActionSpec& action, EvidenceRecorder& evidence);
    StopReason runWhile(const StopCondition& until, const ActionSpec& action, int maxIterations,
                        Clock::time_point start, EvidenceRecorder& evidence);
    StopReason runDoWhile(const StopCondition& until, const ActionSpec& action, int maxIterations,
                          Clock::time_point start, EvidenceRecorder& evidence);

    void performIteration(const ActionSpec& action, LoopType discipline, EvidenceRecorder& evidence);
    bool timedOut(Clock::time_point start) const;
    static void pause(int delayMs);
};

} // namespace reprise

#endif // REPRISE_LOOP_CONTROLLER_H
