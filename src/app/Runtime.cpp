#include "app/Runtime.hpp"

#include <utility>

#include "app/Reports.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace zen::app {

Runtime::Runtime(common::Config config)
    : config_(std::move(config)), scopes_(config_), hub_(scopes_, config_) {
    log::setLevel(config_.logLevel);
    LOG_DEBUG("Runtime started with root scope " << scopes_.rootScope()->id());
}

Runtime::~Runtime() {
    shutdown();
}

void Runtime::loadModules(const std::vector<std::shared_ptr<di::Module>>& modules) {
    modules_.registerModules(modules, *scopes_.rootScope());
}

boost::json::object Runtime::report() {
    boost::json::object object;
    object["scopes"] = toJson(scopes_.stats());
    object["hub"] = toJson(hub_.getHealthStatus());
    object["metrics"] = toJson(common::metrics::Registry::instance().snapshot());
    return object;
}

void Runtime::shutdown() {
    if (shutdown_) {
        return;
    }
    shutdown_ = true;
    modules_.disposeModules(*scopes_.rootScope());
    hub_.clearListeners();
    scopes_.rootScope()->dispose();
    LOG_DEBUG("Runtime shut down");
}

}  // namespace zen::app
