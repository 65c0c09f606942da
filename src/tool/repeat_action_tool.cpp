#include "repeat_action_tool.h"
#include "../common/config_manager.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"

namespace reprise {

RepeatActionTool::RepeatActionTool(std::shared_ptr<IActionExecutor> executor,
                                   std::shared_ptr<IConditionEvaluator> evaluator,
                                   std::shared_ptr<IExecutionHost> host)
    : m_controller(std::move(executor), std::move(evaluator))
    , m_host(std::move(host)) {
}

void RepeatActionTool::applyConfig(const ConfigManager& config) {
    LoopTiming timing;
    timing.forDelayMs = config.getForDelayMs();
    timing.conditionalDelayMs = config.getConditionalDelayMs();
    timing.timeoutMs = config.getElementAttachedTimeoutMs();
    m_controller.setTiming(timing);
    m_controller.setDefaultMaxIterations(config.getDefaultMaxIterations());
}

Report RepeatActionTool::invoke(const RepeatActionRequest& request) {
    try {
        request.validate();

        ExecutionScope scope(m_host, NAME);
        LoopOutcome outcome = m_controller.run(request.loop, request.action, request.limits);
        return ReportBuilder::build(std::move(outcome), request.loop, request.action);
    } catch (const std::exception& e) {
        ErrorHandler::getInstance().handleException(e, NAME);
        throw;
    }
}

Report RepeatActionTool::handle(const nlohmann::json& params) {
    RepeatActionRequest request;
    try {
        request = RepeatActionRequest::fromJson(params);
    } catch (const SpecError& e) {
        ErrorHandler::getInstance().handleException(e, NAME);
        throw;
    }
    return invoke(request);
}

std::string RepeatActionTool::handleToText(const nlohmann::json& params) {
    return handle(params).toJson().dump(2);
}

nlohmann::json RepeatActionTool::describe() {
    return nlohmann::json{
        {"name", NAME},
        {"title", "Repeat Action"},
        {"description", "Repeats a user action (click, hover, fill, press) using for / while / do-while semantics"},
        {"capability", "core"},
        {"type", "readOnly"}
    };
}

} // namespace reprise
