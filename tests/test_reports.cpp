#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>

#include "app/Reports.hpp"
#include "app/Runtime.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "di/Module.hpp"
#include "di/Scope.hpp"

namespace {

struct Cart {
    int items{0};
};

class CartModule : public zen::di::Module {
public:
    std::string name() const override { return "cart"; }
    void registerBindings(zen::di::Scope& scope) override { scope.put(std::make_shared<Cart>()); }
};

}  // namespace

int main() {
    zen::log::setLevel(zen::log::Level::Off);

    // Memory stats and health keep their field names.
    {
        zen::reactive::HealthStatus health;
        health.status = zen::reactive::HealthLevel::Warning;
        health.memoryPressure = zen::reactive::MemoryPressure::Medium;
        health.errorRate = "2.50%";
        health.recommendations.push_back("Reduce listeners");
        health.stats.totalKeys = 2;
        health.stats.totalListeners = 5;
        health.stats.maxListenersPerKey = 4;
        health.stats.notificationCount = 40;
        health.stats.errorCount = 1;

        const auto object = zen::app::toJson(health);
        if (object.at("status").as_string() != "WARNING" || object.at("memoryPressure").as_string() != "MEDIUM" ||
            object.at("errorRate").as_string() != "2.50%" || object.at("recommendations").as_array().size() != 1) {
            std::cerr << "Unexpected health JSON: " << zen::app::serializeJson(object) << "\n";
            return 1;
        }

        const auto& stats = object.at("stats").as_object();
        for (const char* key :
             {"totalKeys", "totalListeners", "maxListenersPerKey", "emptyKeys", "notificationCount", "errorCount"}) {
            if (!stats.contains(key)) {
                std::cerr << "Missing stats field " << key << "\n";
                return 1;
            }
        }
        if (stats.at("totalListeners").to_number<std::uint64_t>() != 5 ||
            stats.at("notificationCount").to_number<std::uint64_t>() != 40) {
            std::cerr << "Unexpected stats values\n";
            return 1;
        }
    }

    // Serialised output parses back to the same document.
    {
        zen::di::ScopeManager::Stats stats;
        stats.totalScopes = 3;
        stats.namedScopes = 2;
        stats.maxDepth = 1;
        stats.totalBindings = 4;
        stats.totalFactories = 1;

        const boost::json::value original = zen::app::toJson(stats);
        const std::string text = zen::app::serializeJson(original);
        if (boost::json::parse(text) != original || text.find("\"totalScopes\":3") == std::string::npos) {
            std::cerr << "Unexpected serialised scope stats: " << text << "\n";
            return 1;
        }
    }

    // The runtime report covers the scope tree and the hub.
    {
        zen::common::Config config;
        config.logLevel = zen::log::Level::Off;
        config.rootScopeName = "ReportRoot";
        zen::app::Runtime runtime(config);
        runtime.loadModules({std::make_shared<CartModule>()});
        auto subscription = runtime.hub().listen<Cart>([](std::shared_ptr<Cart>) {});

        const auto report = runtime.report();
        const auto& scopes = report.at("scopes").as_object();
        const auto& hub = report.at("hub").as_object();
        if (scopes.at("totalScopes").to_number<std::uint64_t>() != 1 ||
            scopes.at("totalBindings").to_number<std::uint64_t>() != 1) {
            std::cerr << "Unexpected scope section: " << zen::app::serializeJson(report) << "\n";
            return 1;
        }
        if (hub.at("status").as_string() != "HEALTHY" ||
            hub.at("stats").as_object().at("totalListeners").to_number<std::uint64_t>() != 1) {
            std::cerr << "Unexpected hub section: " << zen::app::serializeJson(report) << "\n";
            return 1;
        }

        const auto& counters = report.at("metrics").as_object().at("counters").as_object();
        if (!counters.contains("scope.created") || !counters.contains("modules.loaded") ||
            !report.at("metrics").as_object().at("timers").as_object().contains("modules.register")) {
            std::cerr << "Expected scope and module metrics in the report\n";
            return 1;
        }

        subscription.dispose();
        runtime.shutdown();
        if (runtime.modules().hasModule("cart") || runtime.hub().getMemoryStats().totalListeners != 0) {
            std::cerr << "Expected shutdown to unload modules and listeners\n";
            return 1;
        }
        // Idempotent.
        runtime.shutdown();
    }

    return 0;
}
