#include "di/ScopeManager.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "di/CycleDetector.hpp"

namespace zen::di {
namespace {

std::shared_ptr<Scope> lockLive(const std::unordered_map<std::string, std::weak_ptr<Scope>>& map,
                                const std::string& key) {
    auto it = map.find(key);
    if (it == map.end()) {
        return nullptr;
    }
    auto scope = it->second.lock();
    if (!scope || scope->isDisposed()) {
        return nullptr;
    }
    return scope;
}

void collect(const std::shared_ptr<Scope>& scope, std::vector<std::shared_ptr<Scope>>& out) {
    if (!scope || scope->isDisposed()) {
        return;
    }
    out.push_back(scope);
    for (const auto& child : scope->children()) {
        collect(child, out);
    }
}

}  // namespace

ScopeManager::Session::Session(ScopeManager* manager, std::shared_ptr<Scope> scope, std::weak_ptr<Scope> previous)
    : manager_(manager), scope_(std::move(scope)), previous_(std::move(previous)) {}

ScopeManager::Session::~Session() {
    end();
}

ScopeManager::Session::Session(Session&& other) noexcept {
    *this = std::move(other);
}

ScopeManager::Session& ScopeManager::Session::operator=(Session&& other) noexcept {
    if (this != &other) {
        end();
        manager_ = other.manager_;
        scope_ = std::move(other.scope_);
        previous_ = std::move(other.previous_);
        other.manager_ = nullptr;
        other.scope_.reset();
        other.previous_.reset();
    }
    return *this;
}

void ScopeManager::Session::end() {
    if (manager_ == nullptr) {
        return;
    }
    manager_->current_ = previous_;
    LOG_DEBUG("Session on " << (scope_ ? scope_->displayName() : std::string("<none>")) << " ended");
    manager_ = nullptr;
    scope_.reset();
    previous_.reset();
}

ScopeManager::ScopeManager(common::Config config)
    : config_(std::move(config)), index_(std::make_shared<Index>()) {
    createRoot();
}

ScopeManager::~ScopeManager() {
    if (root_ && !root_->isDisposed()) {
        root_->dispose();
    }
}

void ScopeManager::createRoot() {
    root_ = Scope::create(config_.rootScopeName, nullptr, config_.cycleDepthLimit);
    track(root_);
    current_ = root_;
    LOG_DEBUG("Root scope " << root_->id() << " ready");
}

void ScopeManager::track(const std::shared_ptr<Scope>& scope) {
    const std::string id = scope->id();
    const std::optional<std::string> name = scope->name();
    index_->byId[id] = scope;
    if (name) {
        auto existing = lockLive(index_->byName, *name);
        if (existing && existing != scope) {
            LOG_WARN("Scope name '" << *name << "' reused; lookups now return " << id);
        }
        index_->byName[*name] = scope;
    }

    std::weak_ptr<Index> weakIndex = index_;
    const Scope* raw = scope.get();
    scope->registerDisposer([weakIndex, id, name, raw]() {
        auto index = weakIndex.lock();
        if (!index) {
            return;
        }
        auto prune = [raw](std::unordered_map<std::string, std::weak_ptr<Scope>>& map, const std::string& key) {
            auto it = map.find(key);
            if (it == map.end()) {
                return;
            }
            auto held = it->second.lock();
            // Only drop the entry if it still points at the disposing scope.
            if (!held || held.get() == raw) {
                map.erase(it);
            }
        };
        prune(index->byId, id);
        if (name) {
            prune(index->byName, *name);
        }
    });
}

std::shared_ptr<Scope> ScopeManager::rootScope() {
    if (!root_ || root_->isDisposed()) {
        LOG_INFO("Root scope was disposed, creating a new one");
        createRoot();
    }
    return root_;
}

std::shared_ptr<Scope> ScopeManager::currentScope() {
    auto current = current_.lock();
    if (!current || current->isDisposed()) {
        current = rootScope();
        current_ = current;
    }
    return current;
}

void ScopeManager::setCurrentScope(const std::shared_ptr<Scope>& scope) {
    if (scope && scope->isDisposed()) {
        throw core::ScopeDisposedError(scope->displayName(), "setCurrentScope");
    }
    current_ = scope ? scope : rootScope();
}

std::shared_ptr<Scope> ScopeManager::createScope(std::optional<std::string> name, std::shared_ptr<Scope> parent) {
    if (!parent) {
        parent = currentScope();
    }
    auto scope = Scope::create(std::move(name), parent, config_.cycleDepthLimit);
    track(scope);
    common::metrics::Registry::instance().setGauge("scope_manager.indexed", static_cast<double>(index_->byId.size()));
    return scope;
}

std::shared_ptr<Scope> ScopeManager::findScopeByName(const std::string& name) {
    if (auto scope = lockLive(index_->byName, name)) {
        return scope;
    }
    // Scopes built with Scope::createChild are not indexed.
    for (const auto& scope : allScopes()) {
        if (scope->name() == name) {
            return scope;
        }
    }
    return nullptr;
}

std::shared_ptr<Scope> ScopeManager::findScopeById(const std::string& id) {
    if (auto scope = lockLive(index_->byId, id)) {
        return scope;
    }
    for (const auto& scope : allScopes()) {
        if (scope->id() == id) {
            return scope;
        }
    }
    return nullptr;
}

ScopeManager::Session ScopeManager::beginSession(std::shared_ptr<Scope> scope) {
    if (!scope) {
        throw std::invalid_argument("beginSession requires a scope");
    }
    if (scope->isDisposed()) {
        throw core::ScopeDisposedError(scope->displayName(), "beginSession");
    }
    std::weak_ptr<Scope> previous = current_;
    current_ = scope;
    LOG_DEBUG("Session on " << scope->displayName() << " started");
    return Session(this, std::move(scope), std::move(previous));
}

std::vector<std::shared_ptr<Scope>> ScopeManager::allScopes() {
    std::vector<std::shared_ptr<Scope>> scopes;
    collect(rootScope(), scopes);
    return scopes;
}

std::size_t ScopeManager::depthOf(const Scope& scope) const {
    std::size_t depth = 0;
    for (const Scope* parent = scope.parent(); parent != nullptr; parent = parent->parent()) {
        ++depth;
    }
    return depth;
}

bool ScopeManager::detectCycles(InstanceId start) {
    try {
        const auto scopes = allScopes();
        CycleDetector<InstanceId> detector(
            [&scopes](const InstanceId& node) {
                std::set<InstanceId> merged;
                for (const auto& scope : scopes) {
                    const auto edges = scope->localDependenciesOf(node);
                    merged.insert(edges.begin(), edges.end());
                }
                return std::vector<InstanceId>(merged.begin(), merged.end());
            },
            config_.cycleDepthLimit);
        if (auto offender = detector.findCycleFrom(start)) {
            LOG_WARN("Cross-scope dependency cycle through instance#" << *offender);
            return true;
        }
        return false;
    } catch (const std::exception& ex) {
        LOG_ERR("Cross-scope cycle check failed, assuming a cycle: " << ex.what());
        return true;
    } catch (...) {
        LOG_ERR("Cross-scope cycle check failed, assuming a cycle");
        return true;
    }
}

std::string ScopeManager::debugHierarchy() {
    std::ostringstream out;
    const auto current = currentScope();
    std::function<void(const std::shared_ptr<Scope>&, std::size_t)> print =
        [&](const std::shared_ptr<Scope>& scope, std::size_t depth) {
            const std::string indent(depth * 2, ' ');
            out << indent << scope->describe();
            if (scope == current) {
                out << " <- current";
            }
            out << '\n';
            for (const auto& line : scope->describeBindings()) {
                out << indent << "  - " << line << '\n';
            }
            for (const auto& child : scope->children()) {
                print(child, depth + 1);
            }
        };
    print(rootScope(), 0);
    return out.str();
}

ScopeManager::Stats ScopeManager::stats() {
    Stats result;
    for (const auto& scope : allScopes()) {
        ++result.totalScopes;
        if (scope->name()) {
            ++result.namedScopes;
        }
        result.maxDepth = std::max(result.maxDepth, depthOf(*scope));
        result.totalBindings += scope->bindingCount();
        result.totalFactories += scope->factoryCount();
    }
    return result;
}

void ScopeManager::reset() {
    LOG_INFO("Resetting scope tree");
    if (root_ && !root_->isDisposed()) {
        root_->dispose();
    }
    index_->byId.clear();
    index_->byName.clear();
    createRoot();
}

}  // namespace zen::di
