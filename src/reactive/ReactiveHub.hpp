#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/Config.hpp"
#include "di/ScopeManager.hpp"

namespace zen::reactive {

enum class HealthLevel { Healthy, Warning, Critical };
enum class MemoryPressure { Low, Medium, High };

const char* toString(HealthLevel level) noexcept;
const char* toString(MemoryPressure pressure) noexcept;

struct MemoryStats {
    std::size_t totalKeys{0};
    std::size_t totalListeners{0};
    std::size_t maxListenersPerKey{0};
    std::size_t emptyKeys{0};
    std::uint64_t notificationCount{0};
    std::uint64_t errorCount{0};
};

struct HealthStatus {
    HealthLevel status{HealthLevel::Healthy};
    MemoryPressure memoryPressure{MemoryPressure::Low};
    // Percentage of listener invocations that threw, e.g. "2.50%".
    std::string errorRate;
    std::vector<std::string> recommendations;
    MemoryStats stats;
};

// Listener registry keyed by type name or "type name:tag".
//
// Listeners receive the value currently bound under their key, resolved through
// the scope manager's current scope (null when nothing is bound). A listener
// that throws a std::exception is logged and counted; it never stops the
// other listeners or reaches the notifier.
//
// Not thread-safe. Listeners may subscribe and unsubscribe from inside a
// notification.
class ReactiveHub {
public:
    using Listener = std::function<void()>;

    // Move-only handle of one listener. Disposing it, or destroying it, removes
    // the listener; the key goes away with its last listener.
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription();

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void dispose();
        void close() { dispose(); }
        bool isDisposed() const noexcept { return disposed_; }
        const std::string& key() const noexcept { return key_; }

    private:
        friend class ReactiveHub;

        Subscription(ReactiveHub* hub, std::weak_ptr<void> hubAlive, std::string key, std::uint64_t id);

        ReactiveHub* hub_{nullptr};
        std::weak_ptr<void> hubAlive_;
        std::string key_;
        std::uint64_t id_{0};
        bool disposed_{true};
    };

    ReactiveHub(di::ScopeManager& scopes, const common::Config& config);
    ~ReactiveHub();

    ReactiveHub(const ReactiveHub&) = delete;
    ReactiveHub& operator=(const ReactiveHub&) = delete;

    template <typename T>
    static std::string keyFor(const std::optional<std::string>& tag = std::nullopt);

    // Registers callback and calls it once right away with the current value.
    template <typename T>
    Subscription listen(std::function<void(std::shared_ptr<T>)> callback,
                        const std::optional<std::string>& tag = std::nullopt);

    // providerKey is "TypeName", "TypeName:tag" or a bare tag.
    template <typename T>
    Subscription listen(const std::string& providerKey, std::function<void(std::shared_ptr<T>)> callback);

    template <typename T>
    void notifyListeners(const std::optional<std::string>& tag = std::nullopt);

    void notifyKey(const std::string& key);

    // Drops every listener and resets the error statistics. The notification
    // count keeps growing for the lifetime of the hub.
    void clearListeners();

    // Removes keys that have no listeners left.
    void forceCleanup();

    MemoryStats getMemoryStats() const;
    HealthStatus getHealthStatus() const;
    std::string dumpListeners() const;

    std::size_t listenerCount(const std::string& key) const;
    bool hasKey(const std::string& key) const { return listeners_.count(key) != 0; }

private:
    struct ListenerEntry {
        std::uint64_t id{0};
        Listener callback;
    };

    class DispatchGuard {
    public:
        explicit DispatchGuard(ReactiveHub& hub);
        ~DispatchGuard();

        DispatchGuard(const DispatchGuard&) = delete;
        DispatchGuard& operator=(const DispatchGuard&) = delete;

    private:
        ReactiveHub& hub_;
    };

    static std::optional<std::string> tagFromProviderKey(const std::string& typeName, const std::string& providerKey);

    template <typename T>
    Subscription subscribe(const std::optional<std::string>& tag, std::function<void(std::shared_ptr<T>)> callback);

    Subscription addListener(const std::string& key, Listener listener);
    void removeListener(const std::string& key, std::uint64_t id);
    void invoke(const std::string& key, const Listener& listener);
    void runMaintenance();
    void sweepEmptyKeys();
    std::shared_ptr<di::Scope> currentScope() { return scopes_.currentScope(); }

    di::ScopeManager& scopes_;
    common::Config config_;
    std::shared_ptr<void> alive_;
    std::unordered_map<std::string, std::vector<ListenerEntry>> listeners_;
    std::uint64_t nextId_{1};
    std::uint64_t notificationCount_{0};
    std::uint64_t invocationCount_{0};
    std::uint64_t errorCount_{0};
    std::size_t dispatchDepth_{0};
    bool sweepPending_{false};
};

}  // namespace zen::reactive

#include "reactive/ReactiveHub.tpp"
