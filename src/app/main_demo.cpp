#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "app/Reports.hpp"
#include "app/Runtime.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "core/Controller.hpp"
#include "di/Module.hpp"
#include "di/Scope.hpp"

namespace {

class Clock : public zen::core::Service {
public:
    int tick() { return ++ticks_; }
    int ticks() const { return ticks_; }

private:
    int ticks_{0};
};

class Counter {
public:
    explicit Counter(std::shared_ptr<Clock> clock) : clock_(std::move(clock)) {}

    int increment() {
        clock_->tick();
        return ++value_;
    }
    int value() const { return value_; }

private:
    std::shared_ptr<Clock> clock_;
    int value_{0};
};

class GreetingController : public zen::core::Controller {
public:
    const std::string& greeting() const { return greeting_; }

protected:
    void onInit() override { greeting_ = "hello"; }
    void onClose() override { LOG_INFO("GreetingController closed"); }

private:
    std::string greeting_;
};

class CoreModule : public zen::di::Module {
public:
    std::string name() const override { return "core"; }

    void registerBindings(zen::di::Scope& scope) override { scope.put(std::make_shared<Clock>()); }
};

class CounterModule : public zen::di::Module {
public:
    std::string name() const override { return "counter"; }

    std::vector<std::shared_ptr<zen::di::Module>> dependencies() const override {
        return {std::make_shared<CoreModule>()};
    }

    void registerBindings(zen::di::Scope& scope) override {
        zen::di::Scope* owner = &scope;
        scope.lazily<Counter>([owner]() { return std::make_shared<Counter>(owner->findRequired<Clock>()); });
    }

    std::future<void> onDispose(zen::di::Scope& scope) override {
        if (auto counter = scope.findInThisScope<Counter>()) {
            LOG_INFO("Counter finished at " << counter->value());
        }
        return ready();
    }
};

}  // namespace

int main(int argc, char** argv) {
    try {
        auto config = zen::common::Config::fromArgs(argc, argv);
        zen::app::Runtime runtime(config);

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Log level: " << zen::log::levelToString(config.logLevel));
        LOG_INFO("  Hub maintenance interval: " << config.hubMaintenanceInterval);
        LOG_INFO("  Cycle depth limit: " << config.cycleDepthLimit);

        runtime.loadModules({std::make_shared<CounterModule>()});

        auto feature = runtime.scopes().createScope(std::string("feature"));
        feature->put(std::make_shared<GreetingController>(), std::string("greeter"));

        auto session = runtime.scopes().beginSession(feature);
        auto& hub = runtime.hub();
        auto subscription = hub.listen<Counter>([](std::shared_ptr<Counter> counter) {
            if (counter) {
                LOG_INFO("Counter is now " << counter->value());
            }
        });

        auto counter = feature->findRequired<Counter>();
        for (int i = 0; i < 3; ++i) {
            counter->increment();
            hub.notifyListeners<Counter>();
        }

        std::cout << runtime.scopes().debugHierarchy();
        std::cout << hub.dumpListeners() << '\n';
        std::cout << zen::app::serializeJson(runtime.report()) << '\n';

        subscription.dispose();
        session.end();
        feature->dispose();
        runtime.shutdown();
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "zenscope_demo: %s\n", ex.what());
        return 1;
    }
    return 0;
}
