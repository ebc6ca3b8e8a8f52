#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

#include "common/Log.hpp"
#include "core/Controller.hpp"
#include "core/Errors.hpp"
#include "di/Scope.hpp"

using zen::di::Scope;

namespace {

struct Widget {
    explicit Widget(int v = 0) : value(v) {}
    int value;
};

class Tracked : public zen::core::IDisposable {
public:
    void dispose() override {
        ++disposeCalls;
        disposed = true;
    }
    bool isDisposed() const override { return disposed; }

    int disposeCalls{0};
    bool disposed{false};
};

class Screen : public zen::core::Controller {
public:
    int inits{0};
    int readies{0};

protected:
    void onInit() override { ++inits; }
    void onReady() override { ++readies; }
};

class Settings : public zen::core::Service {};

struct Loop {};

bool testHierarchicalShadowing() {
    auto parent = Scope::create(std::string("parent"));
    auto child = parent->createChild(std::string("child"));

    auto v1 = parent->put(std::make_shared<Widget>(1));
    if (child->find<Widget>() != v1) {
        std::cerr << "Expected child to resolve the parent's Widget\n";
        return false;
    }

    auto v2 = child->put(std::make_shared<Widget>(2));
    if (child->find<Widget>() != v2) {
        std::cerr << "Expected child's own Widget to shadow the parent's\n";
        return false;
    }
    if (parent->find<Widget>() != v1) {
        std::cerr << "Expected parent to keep its own Widget\n";
        return false;
    }
    if (child->findInThisScope<Widget>() != v2 || parent->findInThisScope<Widget>() != v1) {
        std::cerr << "Expected findInThisScope to return the local bindings\n";
        return false;
    }
    return true;
}

bool testTaggedScenario() {
    auto root = Scope::create(std::string("root"));
    auto scope = root->createChild(std::string("S"));

    root->put(std::make_shared<std::string>("r"));
    scope->put(std::make_shared<std::string>("s"), std::string("x"));

    auto untagged = scope->find<std::string>();
    if (!untagged || *untagged != "r") {
        std::cerr << "Expected S.find<string>() to return \"r\"\n";
        return false;
    }
    auto tagged = scope->find<std::string>(std::string("x"));
    if (!tagged || *tagged != "s") {
        std::cerr << "Expected S.find<string>(x) to return \"s\"\n";
        return false;
    }
    if (root->find<std::string>(std::string("x")) != nullptr) {
        std::cerr << "Expected root.find<string>(x) to be absent\n";
        return false;
    }
    // A tag resolves only for the type it was bound with.
    if (scope->find<Widget>(std::string("x")) != nullptr) {
        std::cerr << "Expected tag x to be invisible to Widget lookups\n";
        return false;
    }
    return true;
}

bool testLazySingleton() {
    auto scope = Scope::create();
    int calls = 0;
    scope->lazily<Widget>([&calls]() {
        ++calls;
        return std::make_shared<Widget>(calls);
    });

    if (calls != 0) {
        std::cerr << "Expected lazily not to invoke the factory on registration\n";
        return false;
    }
    if (!scope->contains<Widget>() || !scope->exists<Widget>() || calls != 0) {
        std::cerr << "Expected presence checks to see the pending factory without running it\n";
        return false;
    }

    auto first = scope->find<Widget>();
    auto second = scope->find<Widget>();
    if (calls != 1 || !first || first != second) {
        std::cerr << "Expected a lazy factory to run once and return the same instance (calls=" << calls << ")\n";
        return false;
    }
    if (scope->factoryCount() != 0 || scope->bindingCount() != 1) {
        std::cerr << "Expected the materialised instance to replace the factory\n";
        return false;
    }
    return true;
}

bool testAlwaysNewFactory() {
    auto scope = Scope::create();
    int calls = 0;
    scope->putFactory<Widget>([&calls]() { return std::make_shared<Widget>(++calls); });

    auto first = scope->find<Widget>();
    auto second = scope->find<Widget>();
    if (calls != 2 || !first || !second || first == second) {
        std::cerr << "Expected an always-new factory to produce two distinct instances (calls=" << calls << ")\n";
        return false;
    }
    if (scope->useCount<Widget>() != zen::di::kAlwaysNewUseCount) {
        std::cerr << "Expected always-new factories to carry the -2 use count\n";
        return false;
    }
    return true;
}

bool testPermanentProtection() {
    auto scope = Scope::create();
    auto tracked = scope->put(std::make_shared<Tracked>(), std::nullopt, true);

    if (scope->remove<Tracked>()) {
        std::cerr << "Expected removing a permanent binding without force to fail\n";
        return false;
    }
    if (scope->find<Tracked>() != tracked || tracked->disposed) {
        std::cerr << "Expected the permanent binding to survive untouched\n";
        return false;
    }
    if (!scope->remove<Tracked>(std::nullopt, true)) {
        std::cerr << "Expected forced removal of a permanent binding to succeed\n";
        return false;
    }
    if (scope->find<Tracked>() != nullptr || tracked->disposeCalls != 1) {
        std::cerr << "Expected forced removal to drop and dispose the binding\n";
        return false;
    }
    if (scope->remove<Tracked>()) {
        std::cerr << "Expected removing an absent binding to return false\n";
        return false;
    }
    return true;
}

bool testReplacementDisposesPrevious() {
    auto scope = Scope::create();
    auto first = scope->put(std::make_shared<Tracked>());
    auto second = scope->put(std::make_shared<Tracked>());
    if (first->disposeCalls != 1 || second->disposed) {
        std::cerr << "Expected put to dispose the replaced instance only\n";
        return false;
    }
    // Re-binding the same object must not dispose it.
    scope->put(second);
    if (second->disposed) {
        std::cerr << "Expected re-binding the same instance to keep it alive\n";
        return false;
    }
    return true;
}

bool testTagReusedByAnotherType() {
    auto scope = Scope::create();
    scope->put(std::make_shared<Widget>(5), std::string("main"));
    scope->put(std::make_shared<std::string>("text"), std::string("main"));

    if (scope->find<Widget>(std::string("main")) != nullptr) {
        std::cerr << "Expected the tag to move to the newer type\n";
        return false;
    }
    auto text = scope->find<std::string>(std::string("main"));
    if (!text || *text != "text") {
        std::cerr << "Expected the tagged string to resolve\n";
        return false;
    }
    if (!scope->removeByTag("main") || scope->bindingCount() != 0) {
        std::cerr << "Expected removeByTag to clear the tagged slot\n";
        return false;
    }
    return true;
}

bool testRemoveByType() {
    auto scope = Scope::create();
    scope->put(std::make_shared<Widget>(1));
    scope->put(std::make_shared<Widget>(2), std::string("other"));
    if (!scope->removeByType(std::type_index(typeid(Widget)))) {
        std::cerr << "Expected removeByType to remove the untagged Widget\n";
        return false;
    }
    if (scope->find<Widget>() != nullptr || scope->find<Widget>(std::string("other")) == nullptr) {
        std::cerr << "Expected removeByType to leave tagged bindings alone\n";
        return false;
    }
    return true;
}

bool testFindRequired() {
    auto scope = Scope::create(std::string("lonely"));
    try {
        (void)scope->findRequired<Widget>(std::string("t"));
        std::cerr << "Expected findRequired to throw for a missing binding\n";
        return false;
    } catch (const zen::core::DependencyNotFoundError& ex) {
        if (!ex.tag() || *ex.tag() != "t" || ex.typeName().find("Widget") == std::string::npos) {
            std::cerr << "Unexpected DependencyNotFoundError contents: " << ex.what() << "\n";
            return false;
        }
    }
    return true;
}

bool testUseCounts() {
    auto parent = Scope::create();
    auto child = parent->createChild();
    parent->put(std::make_shared<Widget>());
    parent->put(std::make_shared<Loop>(), std::nullopt, true);

    if (child->incrementUseCount<Widget>() != 1 || child->incrementUseCount<Widget>() != 2) {
        std::cerr << "Expected increments from the child to reach the parent's count\n";
        return false;
    }
    if (parent->useCount<Widget>() != 2) {
        std::cerr << "Expected the parent to hold the count\n";
        return false;
    }
    child->decrementUseCount<Widget>();
    child->decrementUseCount<Widget>();
    if (child->decrementUseCount<Widget>() != 0) {
        std::cerr << "Expected decrement to floor at zero\n";
        return false;
    }
    if (child->incrementUseCount<Loop>() != zen::di::kPermanentUseCount || !child->isPermanent<Loop>()) {
        std::cerr << "Expected permanent sentinel to be preserved\n";
        return false;
    }
    if (child->incrementUseCount<std::string>() != 0) {
        std::cerr << "Expected 0 for a binding found nowhere in the chain\n";
        return false;
    }
    return true;
}

bool testControllerLifecycle() {
    auto scope = Scope::create();
    auto screen = scope->put(std::make_shared<Screen>());
    if (!screen->isInitialized() || !screen->isReady() || screen->inits != 1 || screen->readies != 1) {
        std::cerr << "Expected put to initialise and ready a controller once\n";
        return false;
    }

    auto settings = scope->put(std::make_shared<Settings>());
    if (!scope->isPermanent<Settings>() || scope->remove<Settings>()) {
        std::cerr << "Expected services to be bound permanently\n";
        return false;
    }

    scope->remove<Screen>();
    if (!screen->isDisposed()) {
        std::cerr << "Expected removing a controller to dispose it\n";
        return false;
    }
    return settings != nullptr;
}

bool testReentrantFactory() {
    auto scope = Scope::create();
    Scope* raw = scope.get();
    scope->lazily<Loop>([raw]() {
        raw->find<Loop>();
        return std::make_shared<Loop>();
    });
    try {
        (void)scope->find<Loop>();
        std::cerr << "Expected a self-resolving factory to be reported as circular\n";
        return false;
    } catch (const zen::core::CircularDependencyError& ex) {
        if (ex.node().find("Loop") == std::string::npos) {
            std::cerr << "Expected the cycle to name Loop but got " << ex.node() << "\n";
            return false;
        }
    }
    // The factory stays registered after the failure.
    if (!scope->contains<Loop>()) {
        std::cerr << "Expected the failed lazy factory to remain pending\n";
        return false;
    }
    return true;
}

bool testDependencyGraph() {
    auto parent = Scope::create();
    auto child = parent->createChild();
    parent->put(std::make_shared<Widget>());
    auto widgetId = *parent->handleOf<Widget>();
    child->put(std::make_shared<std::string>("dep"), std::nullopt, false, {widgetId});
    auto stringId = *child->handleOf<std::string>();

    if (child->dependenciesOf(stringId) != std::vector<zen::di::InstanceId>{widgetId}) {
        std::cerr << "Expected declared dependencies to be stored as edges\n";
        return false;
    }
    if (child->detectCycles(stringId)) {
        std::cerr << "Expected an acyclic graph to report no cycle\n";
        return false;
    }

    child->addDependency(widgetId, 12345);
    try {
        child->addDependency(widgetId, stringId);
        std::cerr << "Expected an edge closing a cycle to be rejected\n";
        return false;
    } catch (const zen::core::CircularDependencyError&) {
    }
    if (child->detectCycles(stringId)) {
        std::cerr << "Expected the rejected edge to be rolled back\n";
        return false;
    }
    if (child->localDependenciesOf(widgetId) != std::vector<zen::di::InstanceId>{12345}) {
        std::cerr << "Expected earlier edges to survive the rollback\n";
        return false;
    }

    try {
        child->addDependency(7, 7);
        std::cerr << "Expected a self edge to be rejected\n";
        return false;
    } catch (const zen::core::CircularDependencyError&) {
    }
    return true;
}

bool testDepthLimitCountsAsCycle() {
    auto scope = Scope::create(std::nullopt, nullptr, 3);
    scope->addDependency(1, 2);
    scope->addDependency(2, 3);
    scope->addDependency(3, 4);
    scope->addDependency(4, 5);
    if (scope->detectCycles(3)) {
        std::cerr << "Expected a short acyclic walk to stay under the depth limit\n";
        return false;
    }
    if (!scope->detectCycles(1)) {
        std::cerr << "Expected a walk deeper than the limit to be treated as a cycle\n";
        return false;
    }
    return true;
}

bool testClearAll() {
    auto scope = Scope::create();
    auto keep = scope->put(std::make_shared<Tracked>(), std::nullopt, true);
    auto drop = scope->put(std::make_shared<Tracked>(), std::string("temp"));
    scope->lazily<Widget>([]() { return std::make_shared<Widget>(); });

    scope->clearAll();
    if (scope->find<Tracked>() != keep || !drop->disposed || scope->contains<Widget>()) {
        std::cerr << "Expected clearAll to keep permanent bindings and drop the rest\n";
        return false;
    }
    scope->clearAll(true);
    if (scope->bindingCount() != 0 || !keep->disposed) {
        std::cerr << "Expected forced clearAll to drop everything\n";
        return false;
    }
    return true;
}

bool testNullFactoryResult() {
    auto scope = Scope::create();
    scope->lazily<Widget>([]() { return std::shared_ptr<Widget>(); });
    if (scope->find<Widget>() != nullptr || !scope->contains<Widget>()) {
        std::cerr << "Expected a null factory result to resolve to null and keep the factory\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    zen::log::setLevel(zen::log::Level::Off);

    const std::vector<bool (*)()> cases = {
        testHierarchicalShadowing, testTaggedScenario,       testLazySingleton,
        testAlwaysNewFactory,      testPermanentProtection,  testReplacementDisposesPrevious,
        testTagReusedByAnotherType, testRemoveByType,        testFindRequired,
        testUseCounts,             testControllerLifecycle,  testReentrantFactory,
        testDependencyGraph,       testDepthLimitCountsAsCycle, testClearAll,
        testNullFactoryResult,
    };
    for (auto testCase : cases) {
        if (!testCase()) {
            return 1;
        }
    }
    return 0;
}
