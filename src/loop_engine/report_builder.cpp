#include "report_builder.h"

namespace reprise {

nlohmann::json CheckResult::toJson() const {
    return nlohmann::json{
        {"property", property},
        {"operator", operatorName},
        {"expected", expected},
        {"actual", actual},
        {"result", toString(result)}
    };
}

nlohmann::json ReportSummary::toJson() const {
    nlohmann::json json;
    json["total"] = total;
    json["passed"] = passed;
    json["failed"] = failed;
    json["status"] = toString(status);
    json["stopReason"] = toString(stopReason);
    json["elapsedMs"] = elapsedMs;
    json["evidence"] = nlohmann::json::array();
    for (const auto& rec : evidence) {
        json["evidence"].push_back(rec.toJson());
    }
    return json;
}

Report::Report(const ActionSpec& action, const LoopSpec& loop,
               ReportSummary summary, std::vector<CheckResult> checks)
    : m_action(action)
    , m_loop(loop)
    , m_summary(std::move(summary))
    , m_checks(std::move(checks)) {}

nlohmann::json Report::toJson() const {
    nlohmann::json json;
    json["action"] = m_action.toJson();
    json["loop"] = m_loop.toJson();
    json["summary"] = m_summary.toJson();
    json["checks"] = nlohmann::json::array();
    for (const auto& check : m_checks) {
        json["checks"].push_back(check.toJson());
    }
    return json;
}

std::string ReportBuilder::expectedFor(const LoopSpec& loop) {
    switch (loop.type) {
        case LoopType::FOR:
            return std::to_string(loop.iterations.value_or(0)) + " iterations";
        case LoopType::WHILE:
        case LoopType::DO_WHILE:
            return "condition met or maxIterations reached";
    }
    return "";
}

Report ReportBuilder::build(LoopOutcome outcome, const LoopSpec& loop, const ActionSpec& action) {
    const bool ran = outcome.iterations > 0;
    const VerdictStatus status = ran ? VerdictStatus::PASS : VerdictStatus::FAIL;

    ReportSummary summary;
    summary.total = outcome.iterations;
    summary.passed = ran ? 1 : 0;
    summary.failed = ran ? 0 : 1;
    summary.status = status;
    summary.stopReason = outcome.stopReason;
    summary.elapsedMs = outcome.elapsedMs;
    summary.evidence = std::move(outcome.evidence);

    CheckResult check;
    check.property = "action-execution";
    check.operatorName = toString(loop.type);
    check.expected = expectedFor(loop);
    check.actual = outcome.iterations;
    check.result = status;

    return Report(action, loop, std::move(summary), {check});
}

} // namespace reprise
