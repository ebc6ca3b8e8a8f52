#include "di/Scope.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <sstream>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "di/CycleDetector.hpp"

namespace zen::di {
namespace {

std::atomic<std::uint64_t> gScopeCounter{0};
std::atomic<InstanceId> gInstanceCounter{kNoInstance};

std::string instanceLabel(InstanceId id) {
    return "instance#" + std::to_string(id);
}

}  // namespace

std::size_t BindingKeyHash::operator()(const BindingKey& key) const noexcept {
    std::size_t seed = key.type.hash_code();
    if (key.tag) {
        seed ^= std::hash<std::string>{}(*key.tag) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

std::shared_ptr<Scope> Scope::create(std::optional<std::string> name,
                                     const std::shared_ptr<Scope>& parent,
                                     std::size_t cycleDepthLimit) {
    if (parent && parent->disposed_) {
        throw core::ScopeDisposedError(parent->displayName(), "createChild");
    }
    std::shared_ptr<Scope> scope(new Scope(std::move(name), parent.get(), cycleDepthLimit));
    if (parent) {
        parent->children_.push_back(scope);
    }
    common::metrics::Registry::instance().incrementCounter("scope.created");
    LOG_DEBUG("Scope " << scope->id_ << " created"
                       << (parent ? " under " + parent->displayName() : std::string(" as root")));
    return scope;
}

Scope::Scope(std::optional<std::string> name, Scope* parent, std::size_t cycleDepthLimit)
    : id_(name.value_or("scope") + "-" + std::to_string(++gScopeCounter)),
      name_(std::move(name)),
      parent_(parent),
      cycleDepthLimit_(cycleDepthLimit) {}

Scope::~Scope() {
    if (!disposed_) {
        dispose();
    }
}

std::string Scope::displayName() const {
    return name_.value_or(id_);
}

InstanceId Scope::nextInstanceId() {
    return ++gInstanceCounter;
}

void Scope::ensureActive(const char* operation) const {
    if (disposed_) {
        throw core::ScopeDisposedError(displayName(), operation);
    }
}

std::shared_ptr<void> Scope::bindInstance(Binding binding,
                                          const std::optional<std::string>& tag,
                                          bool permanent,
                                          const std::vector<InstanceId>& declaredDeps) {
    const BindingKey key{binding.type.index, tag};

    if (binding.controller != nullptr) {
        binding.controller->initialize();
        binding.controller->markReady();
    }
    if (binding.service) {
        permanent = true;
    }

    binding.id = nextInstanceId();
    factories_.erase(key);
    const InstanceId id = binding.id;
    const std::string label = core::qualifiedKey(binding.type.name, tag);
    std::shared_ptr<void> instance = binding.instance;
    storeBinding(std::move(binding), tag);
    useCount_.insert_or_assign(key, permanent ? kPermanentUseCount : 0);

    if (!declaredDeps.empty()) {
        auto& edges = dependencyGraph_[id];
        edges.insert(declaredDeps.begin(), declaredDeps.end());
    }

    common::metrics::Registry::instance().incrementCounter("scope.bindings");
    LOG_DEBUG("Bound " << label << " as " << instanceLabel(id) << " in " << displayName()
                       << (permanent ? " (permanent)" : ""));
    return instance;
}

void Scope::storeBinding(Binding binding, const std::optional<std::string>& tag) {
    std::optional<Binding> previous;
    const std::type_index type = binding.type.index;

    if (tag) {
        auto it = taggedBindings_.find(*tag);
        if (it != taggedBindings_.end()) {
            previous = it->second;
            if (it->second.type.index != type) {
                // A tag names one slot: the other type loses it.
                untrackTag(it->second.type.index, *tag);
                useCount_.erase(BindingKey{it->second.type.index, tag});
            }
            it->second = binding;
        } else {
            taggedBindings_.emplace(*tag, binding);
        }
        typeToTags_[type].insert(*tag);
    } else {
        auto it = typeBindings_.find(type);
        if (it != typeBindings_.end()) {
            previous = it->second;
            it->second = binding;
        } else {
            typeBindings_.emplace(type, binding);
        }
    }

    if (!previous) {
        return;
    }
    dependencyGraph_.erase(previous->id);
    if (previous->instance.get() != binding.instance.get()) {
        if (previous->disposable != nullptr && !previous->disposable->isDisposed()) {
            LOG_WARN("Replacing " << core::qualifiedKey(previous->type.name, tag) << " in " << displayName()
                                  << ", disposing previous instance");
        }
        disposeBinding(*previous, "replaced");
    }
}

void Scope::registerFactory(const BindingKey& key, FactoryEntry entry, int useCount) {
    const std::string label = core::qualifiedKey(entry.type.name, key.tag);
    if (localBinding(key) != nullptr) {
        LOG_DEBUG("Factory for " << label << " replaces the existing binding in " << displayName());
        eraseBinding(key, true);
    }
    const bool alwaysNew = entry.alwaysNew;
    factories_.insert_or_assign(key, std::move(entry));
    useCount_.insert_or_assign(key, useCount);
    LOG_DEBUG("Registered " << (alwaysNew ? "factory" : "lazy factory") << " for " << label << " in "
                            << displayName());
}

std::shared_ptr<void> Scope::resolveLocal(const core::TypeKey& type, const std::optional<std::string>& tag) {
    if (disposed_) {
        return nullptr;
    }
    const BindingKey key{type.index, tag};
    if (const Binding* binding = localBinding(key)) {
        return binding->instance;
    }
    return materialize(key);
}

std::shared_ptr<void> Scope::materialize(const BindingKey& key) {
    auto it = factories_.find(key);
    if (it == factories_.end()) {
        return nullptr;
    }
    const std::string label = core::qualifiedKey(it->second.type.name, key.tag);
    if (resolving_.count(key) != 0) {
        throw core::CircularDependencyError(label);
    }

    // The factory may register or remove bindings here; work on a copy.
    const FactoryEntry entry = it->second;
    Binding produced = [&]() {
        ResolvingGuard guard(resolving_, key);
        return entry.produce();
    }();

    if (!produced.instance) {
        LOG_WARN("Factory for " << label << " in " << displayName() << " returned null");
        return nullptr;
    }

    if (entry.alwaysNew || disposed_) {
        if (produced.controller != nullptr) {
            produced.controller->initialize();
            produced.controller->markReady();
        }
        return produced.instance;
    }

    factories_.erase(key);
    return bindInstance(std::move(produced), key.tag, entry.permanent, entry.declaredDeps);
}

const Scope::Binding* Scope::localBinding(const BindingKey& key) const {
    if (key.tag) {
        auto it = taggedBindings_.find(*key.tag);
        if (it == taggedBindings_.end() || it->second.type.index != key.type) {
            return nullptr;
        }
        return &it->second;
    }
    auto it = typeBindings_.find(key.type);
    return it == typeBindings_.end() ? nullptr : &it->second;
}

bool Scope::hasLocal(const BindingKey& key) const {
    return localBinding(key) != nullptr || factories_.count(key) != 0;
}

bool Scope::eraseBinding(const BindingKey& key, bool force) {
    const Binding* binding = localBinding(key);
    auto factoryIt = factories_.find(key);
    if (binding == nullptr && factoryIt == factories_.end()) {
        return false;
    }

    auto countIt = useCount_.find(key);
    if (!force && countIt != useCount_.end() && countIt->second == kPermanentUseCount) {
        const std::string& typeName = binding != nullptr ? binding->type.name : factoryIt->second.type.name;
        LOG_WARN("Refusing to remove permanent " << core::qualifiedKey(typeName, key.tag) << " from "
                                                 << displayName() << " without force");
        return false;
    }

    if (factoryIt != factories_.end()) {
        factories_.erase(factoryIt);
    }
    if (countIt != useCount_.end()) {
        useCount_.erase(countIt);
    }
    if (binding == nullptr) {
        return true;
    }

    const Binding removed = *binding;
    if (key.tag) {
        taggedBindings_.erase(*key.tag);
        untrackTag(key.type, *key.tag);
    } else {
        typeBindings_.erase(key.type);
    }
    dependencyGraph_.erase(removed.id);
    for (auto& entry : dependencyGraph_) {
        entry.second.erase(removed.id);
    }

    LOG_DEBUG("Removed " << core::qualifiedKey(removed.type.name, key.tag) << " from " << displayName());
    disposeBinding(removed, "removed");
    return true;
}

void Scope::untrackTag(std::type_index type, const std::string& tag) {
    auto it = typeToTags_.find(type);
    if (it == typeToTags_.end()) {
        return;
    }
    it->second.erase(tag);
    if (it->second.empty()) {
        typeToTags_.erase(it);
    }
}

bool Scope::removeByTag(const std::string& tag, bool force) {
    ensureActive("removeByTag");
    auto it = taggedBindings_.find(tag);
    if (it != taggedBindings_.end()) {
        return eraseBinding(BindingKey{it->second.type.index, tag}, force);
    }
    for (const auto& entry : factories_) {
        if (entry.first.tag == tag) {
            const BindingKey key = entry.first;
            return eraseBinding(key, force);
        }
    }
    return false;
}

bool Scope::removeByType(std::type_index type, bool force) {
    ensureActive("removeByType");
    return eraseBinding(BindingKey{type, std::nullopt}, force);
}

int Scope::adjustUseCount(const BindingKey& key, int delta, const std::string& label) {
    for (Scope* scope = this; scope != nullptr; scope = scope->parent_) {
        if (scope->disposed_) {
            break;
        }
        if (!scope->hasLocal(key)) {
            continue;
        }
        auto it = scope->useCount_.find(key);
        if (it == scope->useCount_.end()) {
            it = scope->useCount_.emplace(key, 0).first;
        }
        if (it->second < 0) {
            return it->second;
        }
        it->second = std::max(0, it->second + delta);
        LOG_DEBUG("Use count of " << label << " in " << scope->displayName() << " is " << it->second);
        return it->second;
    }
    return 0;
}

std::optional<int> Scope::lookupUseCount(const BindingKey& key) const {
    for (const Scope* scope = this; scope != nullptr; scope = scope->parent_) {
        if (scope->disposed_) {
            break;
        }
        if (!scope->hasLocal(key)) {
            continue;
        }
        auto it = scope->useCount_.find(key);
        if (it == scope->useCount_.end()) {
            return 0;
        }
        return it->second;
    }
    return std::nullopt;
}

std::optional<InstanceId> Scope::lookupHandle(const BindingKey& key) const {
    for (const Scope* scope = this; scope != nullptr; scope = scope->parent_) {
        if (scope->disposed_) {
            break;
        }
        if (const Binding* binding = scope->localBinding(key)) {
            return binding->id;
        }
    }
    return std::nullopt;
}

void Scope::disposeBinding(const Binding& binding, const char* reason) const {
    if (binding.disposable == nullptr || binding.disposable->isDisposed()) {
        return;
    }
    try {
        binding.disposable->dispose();
    } catch (const std::exception& ex) {
        LOG_ERR("Disposing " << binding.type.name << " (" << reason << ") in " << displayName()
                             << " failed: " << ex.what());
    } catch (...) {
        LOG_ERR("Disposing " << binding.type.name << " (" << reason << ") in " << displayName()
                             << " failed with a non-standard exception");
    }
}

void Scope::addDependency(InstanceId from, InstanceId to) {
    ensureActive("addDependency");
    auto& edges = dependencyGraph_[from];
    const bool inserted = edges.insert(to).second;
    if (!detectCycles(from)) {
        return;
    }
    if (inserted) {
        auto it = dependencyGraph_.find(from);
        it->second.erase(to);
        if (it->second.empty()) {
            dependencyGraph_.erase(it);
        }
    }
    throw core::CircularDependencyError(instanceLabel(from) + " -> " + instanceLabel(to));
}

std::vector<InstanceId> Scope::dependenciesOf(InstanceId id) const {
    std::set<InstanceId> merged;
    for (const Scope* scope = this; scope != nullptr; scope = scope->parent_) {
        auto it = scope->dependencyGraph_.find(id);
        if (it != scope->dependencyGraph_.end()) {
            merged.insert(it->second.begin(), it->second.end());
        }
    }
    return {merged.begin(), merged.end()};
}

std::vector<InstanceId> Scope::localDependenciesOf(InstanceId id) const {
    auto it = dependencyGraph_.find(id);
    if (it == dependencyGraph_.end()) {
        return {};
    }
    return {it->second.begin(), it->second.end()};
}

bool Scope::detectCycles(InstanceId start) const {
    try {
        CycleDetector<InstanceId> detector([this](const InstanceId& node) { return dependenciesOf(node); },
                                           cycleDepthLimit_);
        const auto offender = detector.findCycleFrom(start);
        if (!offender) {
            return false;
        }
        if (detector.depthLimitHit()) {
            LOG_WARN("Dependency walk from " << instanceLabel(start) << " in " << displayName()
                                             << " exceeded depth " << cycleDepthLimit_);
        } else {
            LOG_WARN("Dependency cycle through " << instanceLabel(*offender) << " in " << displayName());
        }
        return true;
    } catch (const std::exception& ex) {
        LOG_ERR("Cycle check from " << instanceLabel(start) << " in " << displayName()
                                    << " failed, assuming a cycle: " << ex.what());
        return true;
    } catch (...) {
        LOG_ERR("Cycle check from " << instanceLabel(start) << " in " << displayName()
                                    << " failed, assuming a cycle");
        return true;
    }
}

void Scope::registerDisposer(std::function<void()> disposer) {
    ensureActive("registerDisposer");
    disposers_.push_back(std::move(disposer));
}

std::shared_ptr<Scope> Scope::createChild(std::optional<std::string> name) {
    ensureActive("createChild");
    return create(std::move(name), shared_from_this(), cycleDepthLimit_);
}

void Scope::clearAll(bool force) {
    ensureActive("clearAll");
    std::vector<BindingKey> keys;
    keys.reserve(typeBindings_.size() + taggedBindings_.size() + factories_.size());
    for (const auto& entry : typeBindings_) {
        keys.push_back(BindingKey{entry.first, std::nullopt});
    }
    for (const auto& entry : taggedBindings_) {
        keys.push_back(BindingKey{entry.second.type.index, entry.first});
    }
    for (const auto& entry : factories_) {
        if (localBinding(entry.first) == nullptr) {
            keys.push_back(entry.first);
        }
    }

    std::size_t removed = 0;
    for (const auto& key : keys) {
        auto countIt = useCount_.find(key);
        if (!force && countIt != useCount_.end() && countIt->second == kPermanentUseCount) {
            continue;
        }
        if (eraseBinding(key, true)) {
            ++removed;
        }
    }
    LOG_DEBUG("Cleared " << removed << " entries from " << displayName() << (force ? " (forced)" : ""));
}

void Scope::detachChild(const Scope* child) {
    children_.erase(std::remove_if(children_.begin(), children_.end(),
                                   [child](const std::shared_ptr<Scope>& entry) { return entry.get() == child; }),
                    children_.end());
}

void Scope::dispose() {
    if (disposed_ || disposing_) {
        return;
    }
    disposing_ = true;
    // Null when dispose() runs from the destructor.
    const auto self = weak_from_this().lock();
    common::metrics::Registry::ScopedTimer timer("scope.dispose");

    auto disposers = std::move(disposers_);
    disposers_.clear();
    for (auto& disposer : disposers) {
        try {
            disposer();
        } catch (const std::exception& ex) {
            LOG_ERR("Disposer failed in scope " << displayName() << ": " << ex.what());
        } catch (...) {
            LOG_ERR("Disposer failed in scope " << displayName() << " with a non-standard exception");
        }
    }

    auto typed = std::move(typeBindings_);
    auto tagged = std::move(taggedBindings_);
    typeBindings_.clear();
    taggedBindings_.clear();
    for (const auto& entry : typed) {
        disposeBinding(entry.second, "scope disposed");
    }
    for (const auto& entry : tagged) {
        disposeBinding(entry.second, "scope disposed");
    }

    const auto children = children_;
    for (const auto& child : children) {
        child->dispose();
    }

    children_.clear();
    factories_.clear();
    useCount_.clear();
    typeToTags_.clear();
    dependencyGraph_.clear();
    resolving_.clear();
    disposers_.clear();

    if (parent_ != nullptr) {
        Scope* parent = parent_;
        parent_ = nullptr;
        parent->detachChild(this);
    }

    disposed_ = true;
    disposing_ = false;
    common::metrics::Registry::instance().incrementCounter("scope.disposed");
    LOG_DEBUG("Scope " << id_ << " disposed");
}

std::vector<std::string> Scope::describeBindings() const {
    std::vector<std::string> lines;
    auto suffix = [this](const BindingKey& key) -> std::string {
        auto it = useCount_.find(key);
        if (it == useCount_.end()) {
            return "";
        }
        if (it->second == kPermanentUseCount) {
            return " [permanent]";
        }
        if (it->second == kAlwaysNewUseCount) {
            return " [factory]";
        }
        return " [uses=" + std::to_string(it->second) + "]";
    };

    for (const auto& entry : typeBindings_) {
        lines.push_back(entry.second.type.name + suffix(BindingKey{entry.first, std::nullopt}));
    }
    for (const auto& entry : taggedBindings_) {
        lines.push_back(core::qualifiedKey(entry.second.type.name, entry.first) +
                        suffix(BindingKey{entry.second.type.index, entry.first}));
    }
    for (const auto& entry : factories_) {
        lines.push_back(core::qualifiedKey(entry.second.type.name, entry.first.tag) + " (pending)" +
                        suffix(entry.first));
    }
    std::sort(lines.begin(), lines.end());
    return lines;
}

std::vector<InstanceId> Scope::instanceHandles() const {
    std::vector<InstanceId> handles;
    handles.reserve(bindingCount());
    for (const auto& entry : typeBindings_) {
        handles.push_back(entry.second.id);
    }
    for (const auto& entry : taggedBindings_) {
        handles.push_back(entry.second.id);
    }
    std::sort(handles.begin(), handles.end());
    return handles;
}

std::string Scope::describe() const {
    std::ostringstream out;
    out << displayName() << " (" << id_ << ") bindings=" << bindingCount() << " factories=" << factoryCount()
        << " children=" << children_.size();
    if (disposed_) {
        out << " [disposed]";
    }
    return out.str();
}

}  // namespace zen::di
