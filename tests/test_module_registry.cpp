#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "common/Log.hpp"
#include "core/Errors.hpp"
#include "di/Module.hpp"
#include "di/ModuleRegistry.hpp"
#include "di/Scope.hpp"

using zen::di::Module;
using zen::di::ModuleRegistry;
using zen::di::Scope;

namespace {

using ModuleList = std::vector<std::shared_ptr<Module>>;

struct Journal {
    std::vector<std::string> events;
};

// Dependencies are built on demand so that mutual references do not form
// shared_ptr cycles.
class TestModule : public Module {
public:
    TestModule(std::string name, std::shared_ptr<Journal> journal, std::function<ModuleList()> deps = {})
        : name_(std::move(name)), journal_(std::move(journal)), deps_(std::move(deps)) {}

    std::string name() const override { return name_; }

    std::vector<std::shared_ptr<Module>> dependencies() const override { return deps_ ? deps_() : ModuleList{}; }

    void registerBindings(Scope& scope) override {
        journal_->events.push_back("register:" + name_);
        if (failRegister) {
            throw std::runtime_error("register failed: " + name_);
        }
        scope.put(std::make_shared<std::string>(name_), name_);
    }

    std::future<void> onInit(Scope&) override {
        journal_->events.push_back("init:" + name_);
        if (asyncInit) {
            auto journal = journal_;
            auto name = name_;
            return std::async(std::launch::async, [journal, name]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                journal->events.push_back("init-done:" + name);
            });
        }
        return ready();
    }

    std::future<void> onDispose(Scope&) override {
        journal_->events.push_back("dispose:" + name_);
        if (failDispose) {
            std::promise<void> promise;
            promise.set_exception(std::make_exception_ptr(std::runtime_error("dispose failed")));
            return promise.get_future();
        }
        if (failDisposeWithCode) {
            std::promise<void> promise;
            promise.set_exception(std::make_exception_ptr(17));
            return promise.get_future();
        }
        return ready();
    }

    bool failRegister{false};
    bool failDispose{false};
    bool failDisposeWithCode{false};
    bool asyncInit{false};

private:
    std::string name_;
    std::shared_ptr<Journal> journal_;
    std::function<ModuleList()> deps_;
};

std::shared_ptr<TestModule> makeModule(const std::string& name,
                                       const std::shared_ptr<Journal>& journal,
                                       std::function<ModuleList()> deps = {}) {
    return std::make_shared<TestModule>(name, journal, std::move(deps));
}

}  // namespace

int main() {
    zen::log::setLevel(zen::log::Level::Off);

    // Dependencies load first, each module once, with async init awaited in order.
    {
        auto journal = std::make_shared<Journal>();
        auto scope = Scope::create();
        ModuleRegistry registry;

        auto network = makeModule("network", journal);
        network->asyncInit = true;
        auto auth = makeModule("auth", journal, [=]() { return ModuleList{network}; });
        auto app = makeModule("app", journal, [=]() { return ModuleList{auth, network}; });

        registry.registerModules({app}, *scope);

        const std::vector<std::string> expected = {"register:network", "init:network", "init-done:network",
                                                   "register:auth",    "init:auth",    "register:app",
                                                   "init:app"};
        if (journal->events != expected) {
            std::cerr << "Unexpected load sequence:";
            for (const auto& event : journal->events) {
                std::cerr << ' ' << event;
            }
            std::cerr << "\n";
            return 1;
        }
        const std::vector<std::string> order = {"network", "auth", "app"};
        if (registry.loadedModules() != order || !registry.hasModule("auth") || registry.getModule("app") != app) {
            std::cerr << "Expected all three modules to be recorded in load order\n";
            return 1;
        }
        if (!scope->find<std::string>(std::string("auth"))) {
            std::cerr << "Expected module bindings in the target scope\n";
            return 1;
        }

        // Loading again skips what is already loaded.
        journal->events.clear();
        auto extra = makeModule("extra", journal, [=]() { return ModuleList{network}; });
        registry.registerModules({extra}, *scope);
        const std::vector<std::string> second = {"register:extra", "init:extra"};
        if (journal->events != second) {
            std::cerr << "Expected already loaded modules to be skipped\n";
            return 1;
        }

        // Teardown runs in reverse load order and survives failing hooks, including
        // ones that fail with a value that is not a std::exception.
        journal->events.clear();
        auth->failDispose = true;
        app->failDisposeWithCode = true;
        registry.disposeModules(*scope);
        const std::vector<std::string> teardown = {"dispose:extra", "dispose:app", "dispose:auth",
                                                   "dispose:network"};
        if (journal->events != teardown || !registry.loadedModules().empty()) {
            std::cerr << "Expected reverse-order teardown of every module\n";
            return 1;
        }
    }

    // A mutual dependency is rejected before any registration.
    {
        auto journal = std::make_shared<Journal>();
        auto scope = Scope::create();
        ModuleRegistry registry;

        std::function<ModuleList()> m1Deps;
        std::function<ModuleList()> m2Deps;
        m1Deps = [&]() { return ModuleList{makeModule("M2", journal, m2Deps)}; };
        m2Deps = [&]() { return ModuleList{makeModule("M1", journal, m1Deps)}; };

        try {
            registry.registerModules({makeModule("M1", journal, m1Deps)}, *scope);
            std::cerr << "Expected a circular dependency error\n";
            return 1;
        } catch (const zen::core::CircularDependencyError& ex) {
            if (ex.node() != "M1" && ex.node() != "M2") {
                std::cerr << "Expected the cycle to name a module but got " << ex.node() << "\n";
                return 1;
            }
        }
        if (!journal->events.empty() || !registry.loadedModules().empty() || scope->bindingCount() != 0) {
            std::cerr << "Expected no module to be registered when the graph has a cycle\n";
            return 1;
        }
    }

    // Fail-fast: the first error reaches the caller unchanged and stops the sequence.
    {
        auto journal = std::make_shared<Journal>();
        auto scope = Scope::create();
        ModuleRegistry registry;

        auto base = makeModule("base", journal);
        auto broken = makeModule("broken", journal, [=]() { return ModuleList{base}; });
        broken->failRegister = true;
        auto top = makeModule("top", journal, [=]() { return ModuleList{broken}; });

        try {
            registry.registerModules({top}, *scope);
            std::cerr << "Expected the registration failure to propagate\n";
            return 1;
        } catch (const std::runtime_error& ex) {
            if (std::string(ex.what()) != "register failed: broken") {
                std::cerr << "Expected the original error but got " << ex.what() << "\n";
                return 1;
            }
        }
        const std::vector<std::string> loaded = {"base"};
        if (registry.loadedModules() != loaded || registry.hasModule("top")) {
            std::cerr << "Expected loading to stop at the failing module\n";
            return 1;
        }

        registry.clear();
        if (registry.hasModule("base") || registry.getModule("base") != nullptr) {
            std::cerr << "Expected clear() to forget loaded modules\n";
            return 1;
        }
    }

    return 0;
}
