#pragma once

#include <memory>
#include <vector>

#include <boost/json/object.hpp>

#include "common/Config.hpp"
#include "di/Module.hpp"
#include "di/ModuleRegistry.hpp"
#include "di/ScopeManager.hpp"
#include "reactive/ReactiveHub.hpp"

namespace zen::app {

// One self-contained runtime: scope tree, reactive hub bound to it and module
// registry. Several runtimes can live side by side; only the logger and the
// metrics registry are shared by the process.
class Runtime {
public:
    explicit Runtime(common::Config config = {});
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    const common::Config& config() const noexcept { return config_; }
    di::ScopeManager& scopes() noexcept { return scopes_; }
    reactive::ReactiveHub& hub() noexcept { return hub_; }
    di::ModuleRegistry& modules() noexcept { return modules_; }

    // Loads into the root scope.
    void loadModules(const std::vector<std::shared_ptr<di::Module>>& modules);

    // {"scopes": ..., "hub": ..., "metrics": ...}
    boost::json::object report();

    // Tears down modules, listeners and the scope tree. Called by the destructor.
    void shutdown();

private:
    common::Config config_;
    di::ScopeManager scopes_;
    reactive::ReactiveHub hub_;
    di::ModuleRegistry modules_;
    bool shutdown_{false};
};

}  // namespace zen::app
