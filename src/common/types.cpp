#include "types.h"

namespace reprise {

std::string toString(LoopType type) {
    switch (type) {
        case LoopType::FOR: return "for";
        case LoopType::WHILE: return "while";
        case LoopType::DO_WHILE: return "do-while";
    }
    return "unknown";
}

std::string toString(ActionType type) {
    switch (type) {
        case ActionType::CLICK: return "click";
        case ActionType::HOVER: return "hover";
        case ActionType::FILL: return "fill";
        case ActionType::PRESS: return "press";
    }
    return "unknown";
}

std::string toString(AssertionType type) {
    switch (type) {
        case AssertionType::TO_BE_VISIBLE: return "toBeVisible";
        case AssertionType::TO_BE_HIDDEN: return "toBeHidden";
        case AssertionType::TO_BE_ENABLED: return "toBeEnabled";
        case AssertionType::TO_BE_DISABLED: return "toBeDisabled";
    }
    return "unknown";
}

std::string toString(StopReason reason) {
    switch (reason) {
        case StopReason::COMPLETED: return "completed";
        case StopReason::CONDITION_MET: return "condition-met";
        case StopReason::MAX_ITERATIONS: return "max-iterations";
        case StopReason::TIMEOUT: return "timeout";
    }
    return "unknown";
}

std::string toString(VerdictStatus status) {
    switch (status) {
        case VerdictStatus::PASS: return "pass";
        case VerdictStatus::FAIL: return "fail";
    }
    return "unknown";
}

bool parseLoopType(const std::string& name, LoopType& out) {
    if (name == "for") {
        out = LoopType::FOR;
    } else if (name == "while") {
        out = LoopType::WHILE;
    } else if (name == "do-while") {
        out = LoopType::DO_WHILE;
    } else {
        return false;
    }
    return true;
}

bool parseActionType(const std::string& name, ActionType& out) {
    if (name == "click") {
        out = ActionType::CLICK;
    } else if (name == "hover") {
        out = ActionType::HOVER;
    } else if (name == "fill") {
        out = ActionType::FILL;
    } else if (name == "press") {
        out = ActionType::PRESS;
    } else {
        return false;
    }
    return true;
}

bool parseAssertionType(const std::string& name, AssertionType& out) {
    if (name == "toBeVisible") {
        out = AssertionType::TO_BE_VISIBLE;
    } else if (name == "toBeHidden") {
        out = AssertionType::TO_BE_HIDDEN;
    } else if (name == "toBeEnabled") {
        out = AssertionType::TO_BE_ENABLED;
    } else if (name == "toBeDisabled") {
        out = AssertionType::TO_BE_DISABLED;
    } else {
        return false;
    }
    return true;
}

} // namespace reprise
