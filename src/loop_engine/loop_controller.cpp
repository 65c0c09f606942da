#include "loop_controller.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <stdexcept>
#include <thread>

namespace reprise {

LoopController::LoopController(std::shared_ptr<IActionExecutor> executor,
                               std::shared_ptr<IConditionEvaluator> evaluator)
    : m_actionRunner(std::move(executor))
    , m_conditionChecker(std::move(evaluator))
    , m_defaultMaxIterations(20) {
}

void LoopController::setTiming(const LoopTiming& timing) {
    if (timing.forDelayMs < 0 || timing.conditionalDelayMs < 0 || timing.timeoutMs < 0) {
        throw std::invalid_argument("Loop timing values must not be negative");
    }
    m_timing = timing;
}

void LoopController::setDefaultMaxIterations(int maxIterations) {
    if (maxIterations < 1) {
        throw std::invalid_argument("Default maxIterations must be at least 1");
    }
    m_defaultMaxIterations = maxIterations;
}

LoopOutcome LoopController::run(const LoopSpec& loop, const ActionSpec& action, const Limits& limits) {
    loop.validate();
    action.validate();
    limits.validate();

    const int maxIterations = limits.effectiveMaxIterations(m_defaultMaxIterations);
    SLOG_INFO().message("Loop started")
        .context("discipline", toString(loop.type))
        .context("action", toString(action.type))
        .context("ref", action.target.ref)
        .context("max_iterations", loop.type == LoopType::FOR ? *loop.iterations : maxIterations);

    // Duration only; loops never raise the slow-operation warning
    ScopedTimer timer("loop." + toString(loop.type), false);
    EvidenceRecorder evidence;
    const Clock::time_point start = Clock::now();

    LoopOutcome outcome;
    try {
        switch (loop.type) {
            case LoopType::FOR:
                outcome.stopReason = runFor(*loop.iterations, action, evidence);
                break;
            case LoopType::WHILE:
                outcome.stopReason = runWhile(*loop.until, action, maxIterations, start, evidence);
                break;
            case LoopType::DO_WHILE:
                outcome.stopReason = runDoWhile(*loop.until, action, maxIterations, start, evidence);
                break;
        }
    } catch (const std::exception& e) {
        timer.markFailed();
        SLOG_ERROR().message("Loop aborted")
            .context("discipline", toString(loop.type))
            .context("completed_iterations", evidence.size())
            .context("error", e.what());
        throw;
    }

    outcome.elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    outcome.iterations = static_cast<int>(evidence.size());
    outcome.evidence = evidence.release();

    SLOG_INFO().message("Loop finished")
        .context("discipline", toString(loop.type))
        .context("iterations", outcome.iterations)
        .context("stop_reason", toString(outcome.stopReason))
        .context("elapsed_ms", outcome.elapsedMs);
    return outcome;
}

StopReason LoopController::runFor(int iterations, const ActionSpec& action, EvidenceRecorder& evidence) {
    while (static_cast<int>(evidence.size()) < iterations) {
        performIteration(action, LoopType::FOR, evidence);
        pause(m_timing.forDelayMs);
    }
    return StopReason::COMPLETED;
}

StopReason LoopController::runWhile(const StopCondition& until, const ActionSpec& action, int maxIterations,
                                    Clock::time_point start, EvidenceRecorder& evidence) {
    while (true) {
        if (static_cast<int>(evidence.size()) >= maxIterations) {
            return StopReason::MAX_ITERATIONS;
        }
        if (timedOut(start)) {
            return StopReason::TIMEOUT;
        }
        if (m_conditionChecker.evaluate(until)) {
            return StopReason::CONDITION_MET;
        }

        performIteration(action, LoopType::WHILE, evidence);
        pause(m_timing.conditionalDelayMs);
    }
}

StopReason LoopController::runDoWhile(const StopCondition& until, const ActionSpec& action, int maxIterations,
                                      Clock::time_point start, EvidenceRecorder& evidence) {
    while (true) {
        performIteration(action, LoopType::DO_WHILE, evidence);
        pause(m_timing.conditionalDelayMs);

        if (m_conditionChecker.evaluate(until)) {
            return StopReason::CONDITION_MET;
        }
        if (static_cast<int>(evidence.size()) >= maxIterations) {
            return StopReason::MAX_ITERATIONS;
        }
        if (timedOut(start)) {
            return StopReason::TIMEOUT;
        }
    }
}

void LoopController::performIteration(const ActionSpec& action, LoopType discipline, EvidenceRecorder& evidence) {
    m_actionRunner.run(action);
    const auto& rec = evidence.record(static_cast<int>(evidence.size()) + 1, action, discipline);
    SLOG_DEBUG().message(rec.message).context("iteration", rec.iteration);
}

bool LoopController::timedOut(Clock::time_point start) const {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    return elapsed.count() > m_timing.timeoutMs;
}

void LoopController::pause(int delayMs) {
    if (delayMs > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    }
}

} // namespace reprise
