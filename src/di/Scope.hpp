#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "core/TypeKey.hpp"

namespace zen::core {
class Controller;
class IDisposable;
}  // namespace zen::core

namespace zen::di {

// Process-unique handle of a bound instance. 0 is never handed out.
using InstanceId = std::uint64_t;
inline constexpr InstanceId kNoInstance = 0;

inline constexpr int kPermanentUseCount = -1;
inline constexpr int kAlwaysNewUseCount = -2;
inline constexpr std::size_t kDefaultCycleDepthLimit = 100;

struct BindingKey {
    std::type_index type;
    std::optional<std::string> tag;

    bool operator==(const BindingKey& other) const { return type == other.type && tag == other.tag; }
};

struct BindingKeyHash {
    std::size_t operator()(const BindingKey& key) const noexcept;
};

// Node of the hierarchical instance tree.
//
// A scope holds typed bindings (one untagged slot per type) and tagged bindings
// (one slot per tag), pending factories, use counts, a declared dependency
// graph between instance handles, disposers and owned child scopes. Lookups
// fall back to the parent chain; a child's own binding always shadows the
// parent's and lookups never mutate a parent.
//
// Scopes are always owned through std::shared_ptr: create() and createChild()
// are the only ways to build one. A parent keeps its children alive until they
// are disposed; the parent pointer held by a child is non-owning.
//
// Mutating calls on a disposed scope throw core::ScopeDisposedError. Read calls
// (find, findInThisScope, exists, contains) return empty instead.
//
// Not thread-safe: every call is expected on the owning thread.
class Scope : public std::enable_shared_from_this<Scope> {
public:
    template <typename T>
    using Factory = std::function<std::shared_ptr<T>()>;

    static std::shared_ptr<Scope> create(std::optional<std::string> name = std::nullopt,
                                         const std::shared_ptr<Scope>& parent = nullptr,
                                         std::size_t cycleDepthLimit = kDefaultCycleDepthLimit);

    ~Scope();

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

    const std::string& id() const noexcept { return id_; }
    const std::optional<std::string>& name() const noexcept { return name_; }
    std::string displayName() const;
    Scope* parent() const noexcept { return parent_; }
    bool isDisposed() const noexcept { return disposed_; }
    std::vector<std::shared_ptr<Scope>> children() const { return children_; }

    // Binds instance under T, or under tag when one is given. An existing
    // binding in the same slot is replaced and disposed when it exposes
    // core::IDisposable. Services are always bound permanently; controllers are
    // initialised and readied before the binding is stored.
    template <typename T>
    std::shared_ptr<T> put(std::shared_ptr<T> instance,
                           const std::optional<std::string>& tag = std::nullopt,
                           bool permanent = false,
                           const std::vector<InstanceId>& declaredDeps = {});

    // Lazy singleton: factory runs on first resolution, its result replaces the
    // factory and is cached like a put() binding.
    template <typename T>
    void lazily(Factory<T> factory,
                const std::optional<std::string>& tag = std::nullopt,
                std::vector<InstanceId> declaredDeps = {},
                bool permanent = false);

    // Always-new factory: runs on every resolution, nothing is cached.
    template <typename T>
    void putFactory(Factory<T> factory, const std::optional<std::string>& tag = std::nullopt);

    // Resolves in this scope, then up the parent chain. Returns null when the
    // dependency is bound nowhere.
    //
    // NOTE: find() is not a pure read. A pending lazy factory in the scope that
    // answers the lookup is executed and its result cached there, and an
    // always-new factory produces a fresh instance on every call.
    template <typename T>
    std::shared_ptr<T> find(const std::optional<std::string>& tag = std::nullopt);

    // Resolves against this scope only (same materialisation side effect as
    // find()). Never consults the parent.
    template <typename T>
    std::shared_ptr<T> findInThisScope(const std::optional<std::string>& tag = std::nullopt);

    // find() that throws core::DependencyNotFoundError on a miss.
    template <typename T>
    std::shared_ptr<T> findRequired(const std::optional<std::string>& tag = std::nullopt);

    // Chain-wide presence check. Does not run factories.
    template <typename T>
    bool exists(const std::optional<std::string>& tag = std::nullopt) const;

    // Local presence check, pending factories included. Does not run factories.
    template <typename T>
    bool contains(const std::optional<std::string>& tag = std::nullopt) const;

    // Removes the binding (or pending factory). Returns false without side
    // effects when the binding is permanent and force is false, or when nothing
    // is bound. Removed disposable values are disposed.
    template <typename T>
    bool remove(const std::optional<std::string>& tag = std::nullopt, bool force = false);

    bool removeByTag(const std::string& tag, bool force = false);
    bool removeByType(std::type_index type, bool force = false);

    // Reference counts for external auto-disposal policies. Both walk to the
    // nearest ancestor holding the binding when it is not local. Sentinel
    // values are left untouched and returned as-is; decrement floors at 0.
    // Returns 0 when the binding exists nowhere in the chain.
    template <typename T>
    int incrementUseCount(const std::optional<std::string>& tag = std::nullopt);
    template <typename T>
    int decrementUseCount(const std::optional<std::string>& tag = std::nullopt);

    template <typename T>
    std::optional<int> useCount(const std::optional<std::string>& tag = std::nullopt) const;
    template <typename T>
    bool isPermanent(const std::optional<std::string>& tag = std::nullopt) const;

    // Handle of the instance bound under (T, tag) in this scope or an ancestor.
    template <typename T>
    std::optional<InstanceId> handleOf(const std::optional<std::string>& tag = std::nullopt) const;

    // Declares from -> to. Throws core::CircularDependencyError (after undoing
    // the edge) when the edge closes a cycle.
    void addDependency(InstanceId from, InstanceId to);
    std::vector<InstanceId> dependenciesOf(InstanceId id) const;
    std::vector<InstanceId> localDependenciesOf(InstanceId id) const;

    // True when a cycle is reachable from start in the declared graph of this
    // scope and its ancestors. Depth-limit hits and traversal failures count as
    // cycles.
    bool detectCycles(InstanceId start) const;

    void registerDisposer(std::function<void()> disposer);
    std::shared_ptr<Scope> createChild(std::optional<std::string> name = std::nullopt);

    // Removes every binding and factory that is not permanent (everything when
    // force is set). Children and disposers are kept.
    void clearAll(bool force = false);

    // Idempotent teardown: disposers, disposable bindings, children (depth
    // first, over a snapshot), then every table is cleared and the scope is
    // detached from its parent.
    void dispose();

    std::size_t bindingCount() const noexcept { return typeBindings_.size() + taggedBindings_.size(); }
    std::size_t factoryCount() const noexcept { return factories_.size(); }
    std::size_t disposerCount() const noexcept { return disposers_.size(); }
    std::vector<std::string> describeBindings() const;
    std::vector<InstanceId> instanceHandles() const;
    std::string describe() const;

private:
    struct Binding {
        InstanceId id{kNoInstance};
        core::TypeKey type;
        std::shared_ptr<void> instance;
        core::IDisposable* disposable{nullptr};
        core::Controller* controller{nullptr};
        bool service{false};
    };

    struct FactoryEntry {
        core::TypeKey type;
        std::function<Binding()> produce;
        std::vector<InstanceId> declaredDeps;
        bool alwaysNew{false};
        bool permanent{false};
    };

    // Marks a key as being materialised for the duration of a factory call.
    class ResolvingGuard {
    public:
        ResolvingGuard(std::unordered_set<BindingKey, BindingKeyHash>& resolving, BindingKey key)
            : resolving_(resolving), key_(std::move(key)) {
            resolving_.insert(key_);
        }
        ~ResolvingGuard() { resolving_.erase(key_); }

        ResolvingGuard(const ResolvingGuard&) = delete;
        ResolvingGuard& operator=(const ResolvingGuard&) = delete;

    private:
        std::unordered_set<BindingKey, BindingKeyHash>& resolving_;
        BindingKey key_;
    };

    Scope(std::optional<std::string> name, Scope* parent, std::size_t cycleDepthLimit);

    template <typename T>
    static Binding makeBinding(std::shared_ptr<T> instance);

    static InstanceId nextInstanceId();

    void ensureActive(const char* operation) const;
    std::shared_ptr<void> bindInstance(Binding binding,
                                       const std::optional<std::string>& tag,
                                       bool permanent,
                                       const std::vector<InstanceId>& declaredDeps);
    void storeBinding(Binding binding, const std::optional<std::string>& tag);
    void registerFactory(const BindingKey& key, FactoryEntry entry, int useCount);
    std::shared_ptr<void> resolveLocal(const core::TypeKey& type, const std::optional<std::string>& tag);
    std::shared_ptr<void> materialize(const BindingKey& key);
    const Binding* localBinding(const BindingKey& key) const;
    bool hasLocal(const BindingKey& key) const;
    bool eraseBinding(const BindingKey& key, bool force);
    void untrackTag(std::type_index type, const std::string& tag);
    int adjustUseCount(const BindingKey& key, int delta, const std::string& label);
    std::optional<int> lookupUseCount(const BindingKey& key) const;
    std::optional<InstanceId> lookupHandle(const BindingKey& key) const;
    void disposeBinding(const Binding& binding, const char* reason) const;
    void detachChild(const Scope* child);

    std::string id_;
    std::optional<std::string> name_;
    Scope* parent_{nullptr};
    std::size_t cycleDepthLimit_;
    bool disposed_{false};
    bool disposing_{false};

    std::unordered_map<std::type_index, Binding> typeBindings_;
    std::unordered_map<std::string, Binding> taggedBindings_;
    std::unordered_map<std::type_index, std::set<std::string>> typeToTags_;
    std::unordered_map<BindingKey, FactoryEntry, BindingKeyHash> factories_;
    std::unordered_map<BindingKey, int, BindingKeyHash> useCount_;
    std::unordered_map<InstanceId, std::set<InstanceId>> dependencyGraph_;
    std::unordered_set<BindingKey, BindingKeyHash> resolving_;
    std::vector<std::function<void()>> disposers_;
    std::vector<std::shared_ptr<Scope>> children_;
};

}  // namespace zen::di

#include "di/Scope.tpp"
