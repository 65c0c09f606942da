#ifndef REPRISE_TEST_FAKE_PAGE_H
#define REPRISE_TEST_FAKE_PAGE_H

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "loop_engine/element_interfaces.h"
#include "loop_engine/execution_scope.h"
#include "common/error_handler.h"

namespace reprise {
namespace testing {

/**
 * @brief Scripted page state shared by the fake executor and evaluator
 *
 * Element state is computed from the number of actions performed so far,
 * which lets a test say "the dialog becomes visible after 3 clicks".
 */
struct FakePage {
    int actionCalls = 0;          // Interaction methods actually invoked
    int actionLocateCalls = 0;
    int conditionLocateCalls = 0;
    int conditionChecks = 0;
    std::vector<std::string> interactions;  // "click:e1", "fill:e2=hello", ...

    std::set<std::string> missingRefs;      // locate() throws NotFoundError
    int failOnAction = 0;                   // 1-based action that throws ActionError, 0 = never
    int actionSleepMs = 0;

    // Answers for the condition target, given actions performed so far
    std::function<bool(int)> visible = [](int) { return false; };
    std::function<bool(int)> enabled = [](int) { return true; };
};

class FakeActionTarget : public IActionTarget {
public:
    FakeActionTarget(std::shared_ptr<FakePage> page, std::string ref)
        : m_page(std::move(page)), m_ref(std::move(ref)) {}

    void click() override { perform("click"); }
    void hover() override { perform("hover"); }
    void fill(const std::string& value) override { perform("fill", value); }
    void press(const std::string& key) override { perform("press", key); }

private:
    std::shared_ptr<FakePage> m_page;
    std::string m_ref;

    void perform(const std::string& kind, const std::string& value = "") {
        int attempt = m_page->actionCalls + 1;
        if (m_page->failOnAction == attempt) {
            throw ActionError(m_ref, kind, "Element is not interactable: " + m_ref);
        }
        if (m_page->actionSleepMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(m_page->actionSleepMs));
        }
        m_page->actionCalls = attempt;
        m_page->interactions.push_back(kind + ":" + m_ref + (value.empty() ? "" : "=" + value));
    }
};

class FakeActionExecutor : public IActionExecutor {
public:
    explicit FakeActionExecutor(std::shared_ptr<FakePage> page) : m_page(std::move(page)) {}

    std::shared_ptr<IActionTarget> locate(const ElementRef& ref) override {
        m_page->actionLocateCalls++;
        if (m_page->missingRefs.count(ref.ref)) {
            throw NotFoundError(ref.ref, "Ref " + ref.ref + " not found in the current page snapshot");
        }
        return std::make_shared<FakeActionTarget>(m_page, ref.ref);
    }

private:
    std::shared_ptr<FakePage> m_page;
};

class FakeConditionTarget : public IConditionTarget {
public:
    explicit FakeConditionTarget(std::shared_ptr<FakePage> page) : m_page(std::move(page)) {}

    bool isVisible() override { return check(m_page->visible); }
    bool isHidden() override { return !check(m_page->visible); }
    bool isEnabled() override { return check(m_page->enabled); }
    bool isDisabled() override { return !check(m_page->enabled); }

private:
    std::shared_ptr<FakePage> m_page;

    bool check(const std::function<bool(int)>& predicate) {
        m_page->conditionChecks++;
        return predicate(m_page->actionCalls);
    }
};

class FakeConditionEvaluator : public IConditionEvaluator {
public:
    explicit FakeConditionEvaluator(std::shared_ptr<FakePage> page) : m_page(std::move(page)) {}

    std::shared_ptr<IConditionTarget> locate(const ElementRef& ref) override {
        m_page->conditionLocateCalls++;
        if (m_page->missingRefs.count(ref.ref)) {
            throw NotFoundError(ref.ref, "Ref " + ref.ref + " is not a valid element reference");
        }
        return std::make_shared<FakeConditionTarget>(m_page);
    }

private:
    std::shared_ptr<FakePage> m_page;
};

class FakeExecutionHost : public IExecutionHost {
public:
    int begun = 0;
    int ended = 0;
    std::vector<std::string> operations;

    void beginExclusive(const std::string& operation) override {
        begun++;
        operations.push_back(operation);
    }

    void endExclusive(const std::string&) noexcept override {
        ended++;
    }

    bool balanced() const { return begun == ended; }
};

inline ActionSpec clickOn(const std::string& ref) {
    ActionSpec action;
    action.target.ref = ref;
    action.target.element = "Button " + ref;
    action.type = ActionType::CLICK;
    return action;
}

inline StopCondition untilState(const std::string& ref, AssertionType assertion, bool negate = false) {
    StopCondition condition;
    condition.target.ref = ref;
    condition.target.element = "Element " + ref;
    condition.assertionType = assertion;
    condition.negate = negate;
    return condition;
}

} // namespace testing
} // namespace reprise

#endif // REPRISE_TEST_FAKE_PAGE_H
