#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "di/Module.hpp"

namespace zen::di {

class Scope;

// Loads modules in dependency order.
//
// registerModules() collects the transitive dependency set, rejects cycles
// before touching the scope, then runs registerBindings() and waits on
// onInit() module by module. Loading is fail-fast: the first exception stops
// the sequence and reaches the caller unchanged. Modules loaded before the
// failure stay loaded.
class ModuleRegistry {
public:
    ModuleRegistry() = default;

    ModuleRegistry(const ModuleRegistry&) = delete;
    ModuleRegistry& operator=(const ModuleRegistry&) = delete;

    void registerModules(const std::vector<std::shared_ptr<Module>>& modules, Scope& scope);

    // Runs onDispose() of every loaded module, last loaded first. Failures are
    // logged and do not stop the teardown. The registry is empty afterwards.
    void disposeModules(Scope& scope);

    bool hasModule(const std::string& name) const;
    std::shared_ptr<Module> getModule(const std::string& name) const;

    // Names in load order.
    std::vector<std::string> loadedModules() const { return loadOrder_; }

    void clear();

private:
    static std::vector<std::shared_ptr<Module>> collectAll(const std::vector<std::shared_ptr<Module>>& roots);
    static void validateAcyclic(const std::vector<std::shared_ptr<Module>>& modules);
    static std::vector<std::shared_ptr<Module>> loadOrder(const std::vector<std::shared_ptr<Module>>& modules);

    std::unordered_map<std::string, std::shared_ptr<Module>> modules_;
    std::vector<std::string> loadOrder_;
};

}  // namespace zen::di
