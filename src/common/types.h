#ifndef REPRISE_TYPES_H
#define REPRISE_TYPES_H

#include <string>

namespace reprise {

// Loop disciplines
enum class LoopType {
    FOR,
    WHILE,
    DO_WHILE
};

// User actions performed once per iteration
enum class ActionType {
    CLICK,
    HOVER,
    FILL,
    PRESS
};

// Element state predicates usable as stop conditions
enum class AssertionType {
    TO_BE_VISIBLE,
    TO_BE_HIDDEN,
    TO_BE_ENABLED,
    TO_BE_DISABLED
};

// Why a loop stopped. None of these is an error.
enum class StopReason {
    COMPLETED,
    CONDITION_MET,
    MAX_ITERATIONS,
    TIMEOUT
};

enum class VerdictStatus {
    PASS,
    FAIL
};

// Wire names. Each switch is exhaustive with no default so that a new
// enumerator is flagged by -Wswitch wherever it is not handled.
std::string toString(LoopType type);
std::string toString(ActionType type);
std::string toString(AssertionType type);
std::string toString(StopReason reason);
std::string toString(VerdictStatus status);

bool parseLoopType(const std::string& name, LoopType& out);
bool parseActionType(const std::string& name, ActionType& out);
bool parseAssertionType(const std::string& name, AssertionType& out);

} // namespace reprise

#endif // REPRISE_TYPES_H
