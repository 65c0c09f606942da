#include "evidence_recorder.h"
#include <stdexcept>

namespace reprise {

nlohmann::json IterationRecord::toJson() const {
    return nlohmann::json{
        {"iteration", iteration},
        {"action", action.toJson()},
        {"message", message}
    };
}

IterationRecord EvidenceRecorder::makeRecord(int iteration, const ActionSpec& action, LoopType discipline) {
    IterationRecord rec;
    rec.iteration = iteration;
    rec.action = action;

    const std::string n = std::to_string(iteration);
    switch (discipline) {
        case LoopType::FOR:
            rec.message = "Performed for-loop iteration " + n;
            break;
        case LoopType::WHILE:
            rec.message = "Performed while-loop iteration " + n;
            break;
        case LoopType::DO_WHILE:
            rec.message = "Performed do-while iteration " + n;
            break;
    }
    return rec;
}

const IterationRecord& EvidenceRecorder::record(int iteration, const ActionSpec& action, LoopType discipline) {
    if (iteration != static_cast<int>(m_records.size()) + 1) {
        throw std::logic_error("Evidence out of order: expected iteration " +
                               std::to_string(m_records.size() + 1) + ", got " + std::to_string(iteration));
    }
    m_records.push_back(makeRecord(iteration, action, discipline));
    return m_records.back();
}

std::vector<IterationRecord> EvidenceRecorder::release() {
    std::vector<IterationRecord> out;
    out.swap(m_records);
    return out;
}

} // namespace reprise
