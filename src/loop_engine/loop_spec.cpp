#include "loop_spec.h"
#include "../common/error_handler.h"
#include "../common/json_utils.h"

namespace reprise {

namespace {
    using utils::JsonUtils;

    std::string join(const std::string& path, const std::string& field) {
        return path.empty() ? field : path + "." + field;
    }

    void requireObject(const nlohmann::json& json, const std::string& path) {
        if (!json.is_object()) {
            throw SpecError(path, "object",
                "repeat_action: \"" + path + "\" must be an object, got " + JsonUtils::jsonTypeToString(json));
        }
    }

    // Returns false for an absent optional field. A JSON null counts as absent.
    bool checkField(const nlohmann::json& json, const std::string& path,
                    const std::string& field, const std::string& expectedType, bool required) {
        if (!json.contains(field) || json[field].is_null()) {
            if (required) {
                throw SpecError(join(path, field), "required",
                    "repeat_action: \"" + join(path, field) + "\" is required");
            }
            return false;
        }
        if (!JsonUtils::validateJsonField(json, field, expectedType)) {
            throw SpecError(join(path, field), expectedType,
                "repeat_action: \"" + join(path, field) + "\" must be " + expectedType +
                ", got " + JsonUtils::jsonTypeToString(json[field]));
        }
        return true;
    }

    int readInt(const nlohmann::json& json, const std::string& path, const std::string& field) {
        const auto& value = json[field];
        if (!JsonUtils::fitsInt(value)) {
            throw SpecError(join(path, field), "range",
                "repeat_action: \"" + join(path, field) + "\" is out of range");
        }
        return value.get<int>();
    }
}

// ElementRef

nlohmann::json ElementRef::toJson() const {
    nlohmann::json json;
    json["ref"] = ref;
    if (!element.empty()) {
        json["element"] = element;
    }
    return json;
}

ElementRef ElementRef::fromJson(const nlohmann::json& json, const std::string& path) {
    requireObject(json, path);

    ElementRef result;
    checkField(json, path, "ref", "string", true);
    result.ref = json["ref"].get<std::string>();
    if (result.ref.empty()) {
        throw SpecError(join(path, "ref"), "non-empty",
            "repeat_action: \"" + join(path, "ref") + "\" must not be empty");
    }

    if (checkField(json, path, "element", "string", false)) {
        result.element = json["element"].get<std::string>();
    }
    return result;
}

// StopCondition

nlohmann::json StopCondition::toJson() const {
    nlohmann::json json = target.toJson();
    json["assertion"] = {{"assertionType", toString(assertionType)}};
    json["negate"] = negate;
    return json;
}

StopCondition StopCondition::fromJson(const nlohmann::json& json, const std::string& path) {
    requireObject(json, path);

    StopCondition result;
    result.target = ElementRef::fromJson(json, path);

    const std::string assertionPath = join(path, "assertion");
    checkField(json, path, "assertion", "object", true);
    const auto& assertion = json["assertion"];
    checkField(assertion, assertionPath, "assertionType", "string", true);

    const std::string assertionName = assertion["assertionType"].get<std::string>();
    if (!parseAssertionType(assertionName, result.assertionType)) {
        throw SpecError(join(assertionPath, "assertionType"), "unsupported",
            "Unsupported assertion type: " + assertionName);
    }

    if (checkField(json, path, "negate", "boolean", false)) {
        result.negate = json["negate"].get<bool>();
    }
    return result;
}

// ActionSpec

void ActionSpec::validate() const {
    if (target.ref.empty()) {
        throw SpecError("action.ref", "non-empty", "repeat_action: \"action.ref\" must not be empty");
    }

    switch (type) {
        case ActionType::CLICK:
        case ActionType::HOVER:
            return;
        case ActionType::FILL:
            if (!value) {
                throw SpecError("action.value", "required", "Fill action requires a value");
            }
            return;
        case ActionType::PRESS:
            if (!value) {
                throw SpecError("action.value", "required", "Press action requires a value");
            }
            return;
    }
}

nlohmann::json ActionSpec::toJson() const {
    nlohmann::json json = target.toJson();
    json["type"] = toString(type);
    if (value) {
        json["value"] = *value;
    }
    return json;
}

ActionSpec ActionSpec::fromJson(const nlohmann::json& json, const std::string& path) {
    requireObject(json, path);

    ActionSpec result;
    result.target = ElementRef::fromJson(json, path);

    checkField(json, path, "type", "string", true);
    const std::string typeName = json["type"].get<std::string>();
    if (!parseActionType(typeName, result.type)) {
        throw SpecError(join(path, "type"), "unsupported", "Unsupported action type: " + typeName);
    }

    if (checkField(json, path, "value", "string", false)) {
        result.value = json["value"].get<std::string>();
    }
    return result;
}

// LoopSpec

void LoopSpec::validate() const {
    switch (type) {
        case LoopType::FOR:
            if (!iterations) {
                throw SpecError("loop.iterations", "required",
                    "repeat_action: \"iterations\" is required when loop.type is \"for\"");
            }
            if (*iterations < 0) {
                throw SpecError("loop.iterations", "non-negative",
                    "repeat_action: \"iterations\" must not be negative, got " + std::to_string(*iterations));
            }
            return;
        case LoopType::WHILE:
        case LoopType::DO_WHILE:
            if (!until) {
                throw SpecError("loop.until", "required",
                    "repeat_action: \"until\" condition is required when loop.type is \"" + toString(type) + "\"");
            }
            if (until->target.ref.empty()) {
                throw SpecError("loop.until.ref", "non-empty",
                    "repeat_action: \"loop.until.ref\" must not be empty");
            }
            return;
    }
}

nlohmann::json LoopSpec::toJson() const {
    nlohmann::json json;
    json["type"] = toString(type);
    if (iterations) {
        json["iterations"] = *iterations;
    }
    if (until) {
        json["until"] = until->toJson();
    }
    return json;
}

LoopSpec LoopSpec::fromJson(const nlohmann::json& json, const std::string& path) {
    requireObject(json, path);

    LoopSpec result;
    checkField(json, path, "type", "string", true);
    const std::string typeName = json["type"].get<std::string>();
    if (!parseLoopType(typeName, result.type)) {
        throw SpecError(join(path, "type"), "unsupported", "Unsupported loop type: " + typeName);
    }

    if (checkField(json, path, "iterations", "integer", false)) {
        result.iterations = readInt(json, path, "iterations");
    }
    if (json.contains("until") && !json["until"].is_null()) {
        result.until = StopCondition::fromJson(json["until"], join(path, "until"));
    }
    return result;
}

LoopSpec LoopSpec::forLoop(int iterations) {
    LoopSpec spec;
    spec.type = LoopType::FOR;
    spec.iterations = iterations;
    return spec;
}

LoopSpec LoopSpec::whileLoop(const StopCondition& until) {
    LoopSpec spec;
    spec.type = LoopType::WHILE;
    spec.until = until;
    return spec;
}

LoopSpec LoopSpec::doWhileLoop(const StopCondition& until) {
    LoopSpec spec;
    spec.type = LoopType::DO_WHILE;
    spec.until = until;
    return spec;
}

// Limits

void Limits::validate() const {
    if (maxIterations && *maxIterations < 1) {
        throw SpecError("limits.maxIterations", "positive",
            "repeat_action: \"maxIterations\" must be at least 1, got " + std::to_string(*maxIterations));
    }
}

nlohmann::json Limits::toJson() const {
    nlohmann::json json = nlohmann::json::object();
    if (maxIterations) {
        json["maxIterations"] = *maxIterations;
    }
    return json;
}

Limits Limits::fromJson(const nlohmann::json& json, const std::string& path) {
    requireObject(json, path);

    Limits result;
    if (checkField(json, path, "maxIterations", "integer", false)) {
        result.maxIterations = readInt(json, path, "maxIterations");
    }
    return result;
}

// RepeatActionRequest

void RepeatActionRequest::validate() const {
    loop.validate();
    action.validate();
    limits.validate();
}

nlohmann::json RepeatActionRequest::toJson() const {
    nlohmann::json json;
    json["loop"] = loop.toJson();
    json["action"] = action.toJson();
    json["limits"] = limits.toJson();
    return json;
}

RepeatActionRequest RepeatActionRequest::fromJson(const nlohmann::json& json) {
    requireObject(json, "params");

    RepeatActionRequest request;
    checkField(json, "", "loop", "object", true);
    request.loop = LoopSpec::fromJson(json["loop"], "loop");

    checkField(json, "", "action", "object", true);
    request.action = ActionSpec::fromJson(json["action"], "action");

    if (json.contains("limits") && !json["limits"].is_null()) {
        request.limits = Limits::fromJson(json["limits"], "limits");
    }

    request.validate();
    return request;
}

} // namespace reprise
