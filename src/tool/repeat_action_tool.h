#ifndef REPRISE_REPEAT_ACTION_TOOL_H
#define REPRISE_REPEAT_ACTION_TOOL_H

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "../loop_engine/execution_scope.h"
#include "../loop_engine/loop_controller.h"
#include "../loop_engine/report_builder.h"

namespace reprise {

class ConfigManager;

/**
 * @class RepeatActionTool
 * @brief The repeat_action tool as seen by its host
 *
 * Takes {loop, action, limits?}, runs the loop inside an exclusive section
 * of the host and returns the Report. Invalid requests fail the call before any
 * iteration; element errors abort the loop and fail the call. Both are
 * recorded with the ErrorHandler and rethrown.
 */
class RepeatActionTool {
public:
    static constexpr const char* NAME = "repeat_action";

    RepeatActionTool(std::shared_ptr<IActionExecutor> executor,
                     std::shared_ptr<IConditionEvaluator> evaluator,
                     std::shared_ptr<IExecutionHost> host = nullptr);

    // Takes loop timing and the default iteration cap from configuration
    void applyConfig(const ConfigManager& config);

    LoopController& controller() { return m_controller; }

    Report invoke(const RepeatActionRequest& request);
    // Parses the raw tool parameters, then invokes
    Report handle(const nlohmann::json& params);

    // Report serialized with 2-space indentation, as returned to the host
    std::string handleToText(const nlohmann::json& params);

    // Tool metadata for host registration
    static nlohmann::json describe();

private:
    LoopController m_controller;
    std::shared_ptr<IExecutionHost> m_host;
};

} // namespace reprise

#endif // REPRISE_REPEAT_ACTION_TOOL_H
