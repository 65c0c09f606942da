#ifndef REPRISE_REPORT_BUILDER_H
#define REPRISE_REPORT_BUILDER_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "loop_controller.h"

namespace reprise {

struct CheckResult {
    std::string property;
    std::string operatorName;
    std::string expected;
    int actual;
    VerdictStatus result;

    CheckResult() : actual(0), result(VerdictStatus::FAIL) {}

    nlohmann::json toJson() const;
};

struct ReportSummary {
    int total;
    int passed;
    int failed;
    VerdictStatus status;
    StopReason stopReason;
    long long elapsedMs;
    std::vector<IterationRecord> evidence;

    ReportSummary() : total(0), passed(0), failed(0), status(VerdictStatus::FAIL),
                      stopReason(StopReason::COMPLETED), elapsedMs(0) {}

    nlohmann::json toJson() const;
};

/**
 * @brief Final result of one repeat_action invocation
 *
 * Only ReportBuilder constructs reports; they are read-only afterwards.
 */
class Report {
public:
    const ActionSpec& action() const { return m_action; }
    const LoopSpec& loop() const { return m_loop; }
    const ReportSummary& summary() const { return m_summary; }
    const std::vector<CheckResult>& checks() const { return m_checks; }

    bool passed() const { return m_summary.status == VerdictStatus::PASS; }

    nlohmann::json toJson() const;

private:
    friend class ReportBuilder;

    Report(const ActionSpec& action, const LoopSpec& loop,
           ReportSummary summary, std::vector<CheckResult> checks);

    ActionSpec m_action;
    LoopSpec m_loop;
    ReportSummary m_summary;
    std::vector<CheckResult> m_checks;
};

class ReportBuilder {
public:
    // status is PASS iff at least one iteration completed, whatever the discipline
    static Report build(LoopOutcome outcome, const LoopSpec& loop, const ActionSpec& action);

    static std::string expectedFor(const LoopSpec& loop);
};

} // namespace reprise

#endif // REPRISE_REPORT_BUILDER_H
