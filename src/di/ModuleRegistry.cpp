#include "di/ModuleRegistry.hpp"

#include <deque>
#include <exception>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/Errors.hpp"
#include "di/CycleDetector.hpp"
#include "di/Scope.hpp"

namespace zen::di {
namespace {

using ModuleMap = std::unordered_map<std::string, std::shared_ptr<Module>>;

ModuleMap byName(const std::vector<std::shared_ptr<Module>>& modules) {
    ModuleMap map;
    for (const auto& module : modules) {
        map.emplace(module->name(), module);
    }
    return map;
}

std::string joinNames(const std::vector<std::shared_ptr<Module>>& modules) {
    std::ostringstream out;
    for (std::size_t i = 0; i < modules.size(); ++i) {
        if (i != 0) {
            out << " -> ";
        }
        out << modules[i]->name();
    }
    return out.str();
}

}  // namespace

std::vector<std::shared_ptr<Module>> ModuleRegistry::collectAll(const std::vector<std::shared_ptr<Module>>& roots) {
    std::vector<std::shared_ptr<Module>> all;
    std::unordered_set<std::string> seen;
    std::deque<std::shared_ptr<Module>> pending(roots.begin(), roots.end());

    while (!pending.empty()) {
        auto module = std::move(pending.front());
        pending.pop_front();
        if (!module) {
            throw std::invalid_argument("Null module in dependency list");
        }
        if (!seen.insert(module->name()).second) {
            continue;
        }
        for (auto& dependency : module->dependencies()) {
            if (!dependency) {
                throw std::invalid_argument("Module " + module->name() + " declares a null dependency");
            }
            if (seen.count(dependency->name()) == 0) {
                pending.push_back(std::move(dependency));
            }
        }
        all.push_back(std::move(module));
    }
    return all;
}

void ModuleRegistry::validateAcyclic(const std::vector<std::shared_ptr<Module>>& modules) {
    const ModuleMap map = byName(modules);
    CycleDetector<std::string> detector([&map](const std::string& name) {
        std::vector<std::string> names;
        auto it = map.find(name);
        if (it == map.end()) {
            return names;
        }
        for (const auto& dependency : it->second->dependencies()) {
            names.push_back(dependency->name());
        }
        return names;
    });

    for (const auto& module : modules) {
        if (auto offender = detector.findCycleFrom(module->name())) {
            throw core::CircularDependencyError(*offender);
        }
    }
}

std::vector<std::shared_ptr<Module>> ModuleRegistry::loadOrder(const std::vector<std::shared_ptr<Module>>& modules) {
    const ModuleMap map = byName(modules);
    std::vector<std::shared_ptr<Module>> order;
    std::unordered_set<std::string> visited;

    std::function<void(const std::shared_ptr<Module>&)> visit = [&](const std::shared_ptr<Module>& module) {
        if (!visited.insert(module->name()).second) {
            return;
        }
        for (const auto& dependency : module->dependencies()) {
            auto it = map.find(dependency->name());
            if (it != map.end()) {
                visit(it->second);
            }
        }
        order.push_back(module);
    };

    for (const auto& module : modules) {
        visit(module);
    }
    return order;
}

void ModuleRegistry::registerModules(const std::vector<std::shared_ptr<Module>>& modules, Scope& scope) {
    if (modules.empty()) {
        return;
    }
    common::metrics::Registry::ScopedTimer timer("modules.register");

    const auto all = collectAll(modules);
    validateAcyclic(all);
    const auto order = loadOrder(all);

    LOG_INFO("Loading " << order.size() << " modules: " << joinNames(order));

    for (const auto& module : order) {
        const std::string name = module->name();
        if (modules_.count(name) != 0) {
            LOG_DEBUG("Module " << name << " already loaded, skipping");
            continue;
        }

        module->registerBindings(scope);
        module->onInit(scope).get();

        modules_.emplace(name, module);
        loadOrder_.push_back(name);
        common::metrics::Registry::instance().incrementCounter("modules.loaded");
        LOG_INFO("Loaded module " << name);
    }
}

void ModuleRegistry::disposeModules(Scope& scope) {
    for (auto it = loadOrder_.rbegin(); it != loadOrder_.rend(); ++it) {
        auto found = modules_.find(*it);
        if (found == modules_.end()) {
            continue;
        }
        try {
            found->second->onDispose(scope).get();
            LOG_DEBUG("Disposed module " << *it);
        } catch (const std::exception& ex) {
            LOG_ERR("onDispose failed for module " << *it << ": " << ex.what());
        } catch (...) {
            LOG_ERR("onDispose failed for module " << *it << " with a non-standard exception");
        }
    }
    clear();
}

bool ModuleRegistry::hasModule(const std::string& name) const {
    return modules_.count(name) != 0;
}

std::shared_ptr<Module> ModuleRegistry::getModule(const std::string& name) const {
    auto it = modules_.find(name);
    return it == modules_.end() ? nullptr : it->second;
}

void ModuleRegistry::clear() {
    modules_.clear();
    loadOrder_.clear();
    LOG_DEBUG("Module registry cleared");
}

}  // namespace zen::di
