#ifndef REPRISE_EVIDENCE_RECORDER_H
#define REPRISE_EVIDENCE_RECORDER_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "loop_spec.h"

namespace reprise {

struct IterationRecord {
    int iteration;  // 1-based
    ActionSpec action;
    std::string message;

    IterationRecord() : iteration(0) {}

    nlohmann::json toJson() const;
};

/**
 * @brief Append-only log of completed iterations
 *
 * Records are kept in strictly increasing iteration order, one per
 * successfully completed action.
 */
class EvidenceRecorder {
public:
    // Pure construction of a record; does not append
    static IterationRecord makeRecord(int iteration, const ActionSpec& action, LoopType discipline);

    // Appends the record for the next iteration; throws std::logic_error if out of order
    const IterationRecord& record(int iteration, const ActionSpec& action, LoopType discipline);

    const std::vector<IterationRecord>& records() const { return m_records; }
    size_t size() const { return m_records.size(); }

    std::vector<IterationRecord> release();

private:
    std::vector<IterationRecord> m_records;
};

} // namespace reprise

#endif // REPRISE_EVIDENCE_RECORDER_H
