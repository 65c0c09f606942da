#ifndef REPRISE_LOOP_SPEC_H
#define REPRISE_LOOP_SPEC_H

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "../common/types.h"

namespace reprise {

/**
 * @brief Reference to a target element
 *
 * @c ref is the exact reference taken from a page snapshot. @c element is
 * an optional human readable description used for logs and permission
 * prompts.
 */
struct ElementRef {
    std::string ref;
    std::string element;

    nlohmann::json toJson() const;
    static ElementRef fromJson(const nlohmann::json& json, const std::string& path);
};

struct StopCondition {
    ElementRef target;
    AssertionType assertionType;
    bool negate;

    StopCondition() : assertionType(AssertionType::TO_BE_VISIBLE), negate(false) {}

    nlohmann::json toJson() const;
    static StopCondition fromJson(const nlohmann::json& json, const std::string& path);
};

struct ActionSpec {
    ElementRef target;
    ActionType type;
    std::optional<std::string> value;  // Required for FILL and PRESS only

    ActionSpec() : type(ActionType::CLICK) {}

    // Throws SpecError when FILL or PRESS has no value
    void validate() const;

    nlohmann::json toJson() const;
    static ActionSpec fromJson(const nlohmann::json& json, const std::string& path);
};

struct LoopSpec {
    LoopType type;
    std::optional<int> iterations;       // FOR only
    std::optional<StopCondition> until;  // WHILE and DO_WHILE only

    LoopSpec() : type(LoopType::FOR) {}

    // Throws SpecError when the field the discipline needs is missing or out of range
    void validate() const;

    nlohmann::json toJson() const;
    static LoopSpec fromJson(const nlohmann::json& json, const std::string& path);

    static LoopSpec forLoop(int iterations);
    static LoopSpec whileLoop(const StopCondition& until);
    static LoopSpec doWhileLoop(const StopCondition& until);
};

struct Limits {
    std::optional<int> maxIterations;  // Applies to WHILE and DO_WHILE

    int effectiveMaxIterations(int fallback) const {
        return maxIterations ? *maxIterations : fallback;
    }

    void validate() const;

    nlohmann::json toJson() const;
    static Limits fromJson(const nlohmann::json& json, const std::string& path);
};

/**
 * @brief One repeat_action invocation: {loop, action, limits?}
 */
struct RepeatActionRequest {
    LoopSpec loop;
    ActionSpec action;
    Limits limits;

    void validate() const;

    nlohmann::json toJson() const;

    // Parses and validates; throws SpecError naming the offending field
    static RepeatActionRequest fromJson(const nlohmann::json& json);
};

} // namespace reprise

#endif // REPRISE_LOOP_SPEC_H
