#ifndef REPRISE_ELEMENT_INTERFACES_H
#define REPRISE_ELEMENT_INTERFACES_H

#include <memory>
#include <string>
#include "loop_spec.h"

namespace reprise {

/**
 * @brief A resolved element that can be interacted with
 *
 * Each method throws ActionError when the interaction fails (for example
 * the element is detached or not interactable).
 */
class IActionTarget {
public:
    virtual ~IActionTarget() = default;

    virtual void click() = 0;
    virtual void hover() = 0;
    virtual void fill(const std::string& value) = 0;
    virtual void press(const std::string& key) = 0;
};

/**
 * @brief Resolves element references for actions
 */
class IActionExecutor {
public:
    virtual ~IActionExecutor() = default;

    // Throws NotFoundError if the reference cannot be resolved
    virtual std::shared_ptr<IActionTarget> locate(const ElementRef& ref) = 0;
};

/**
 * @brief A resolved element whose state can be queried
 *
 * State queries on a missing element answer false (or true for isHidden)
 * rather than throwing.
 */
class IConditionTarget {
public:
    virtual ~IConditionTarget() = default;

    virtual bool isVisible() = 0;
    virtual bool isHidden() = 0;
    virtual bool isEnabled() = 0;
    virtual bool isDisabled() = 0;
};

/**
 * @brief Resolves element references for stop conditions
 */
class IConditionEvaluator {
public:
    virtual ~IConditionEvaluator() = default;

    // Throws NotFoundError only for a structurally invalid reference
    virtual std::shared_ptr<IConditionTarget> locate(const ElementRef& ref) = 0;
};

} // namespace reprise

#endif // REPRISE_ELEMENT_INTERFACES_H
