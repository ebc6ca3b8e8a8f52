#include "reactive/ReactiveHub.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <sstream>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace zen::reactive {

const char* toString(HealthLevel level) noexcept {
    switch (level) {
    case HealthLevel::Healthy:
        return "HEALTHY";
    case HealthLevel::Warning:
        return "WARNING";
    case HealthLevel::Critical:
        return "CRITICAL";
    }
    return "UNKNOWN";
}

const char* toString(MemoryPressure pressure) noexcept {
    switch (pressure) {
    case MemoryPressure::Low:
        return "LOW";
    case MemoryPressure::Medium:
        return "MEDIUM";
    case MemoryPressure::High:
        return "HIGH";
    }
    return "UNKNOWN";
}

ReactiveHub::Subscription::Subscription(ReactiveHub* hub,
                                        std::weak_ptr<void> hubAlive,
                                        std::string key,
                                        std::uint64_t id)
    : hub_(hub), hubAlive_(std::move(hubAlive)), key_(std::move(key)), id_(id), disposed_(false) {}

ReactiveHub::Subscription::~Subscription() {
    dispose();
}

ReactiveHub::Subscription::Subscription(Subscription&& other) noexcept {
    *this = std::move(other);
}

ReactiveHub::Subscription& ReactiveHub::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        dispose();
        hub_ = other.hub_;
        hubAlive_ = std::move(other.hubAlive_);
        key_ = std::move(other.key_);
        id_ = other.id_;
        disposed_ = other.disposed_;
        other.hub_ = nullptr;
        other.hubAlive_.reset();
        other.id_ = 0;
        other.disposed_ = true;
    }
    return *this;
}

void ReactiveHub::Subscription::dispose() {
    if (disposed_) {
        return;
    }
    disposed_ = true;
    if (hub_ != nullptr && !hubAlive_.expired()) {
        hub_->removeListener(key_, id_);
    }
    hub_ = nullptr;
    hubAlive_.reset();
}

ReactiveHub::DispatchGuard::DispatchGuard(ReactiveHub& hub) : hub_(hub) {
    ++hub_.dispatchDepth_;
}

ReactiveHub::DispatchGuard::~DispatchGuard() {
    if (--hub_.dispatchDepth_ == 0 && hub_.sweepPending_) {
        hub_.sweepEmptyKeys();
    }
}

ReactiveHub::ReactiveHub(di::ScopeManager& scopes, const common::Config& config)
    : scopes_(scopes), config_(config), alive_(std::make_shared<int>(0)) {
    if (config_.hubMaintenanceInterval == 0) {
        config_.hubMaintenanceInterval = 1;
    }
}

ReactiveHub::~ReactiveHub() {
    alive_.reset();
}

std::optional<std::string> ReactiveHub::tagFromProviderKey(const std::string& typeName,
                                                           const std::string& providerKey) {
    if (providerKey.empty() || providerKey == typeName) {
        return std::nullopt;
    }
    const std::string prefix = typeName + ":";
    if (providerKey.compare(0, prefix.size(), prefix) == 0) {
        return providerKey.substr(prefix.size());
    }
    return providerKey;
}

ReactiveHub::Subscription ReactiveHub::addListener(const std::string& key, Listener listener) {
    const std::uint64_t id = nextId_++;
    listeners_[key].push_back(ListenerEntry{id, std::move(listener)});
    LOG_DEBUG("Listener " << id << " added to " << key);
    return Subscription(this, alive_, key, id);
}

void ReactiveHub::removeListener(const std::string& key, std::uint64_t id) {
    auto it = listeners_.find(key);
    if (it == listeners_.end()) {
        return;
    }
    auto& entries = it->second;
    // Order-preserving erase keeps an in-flight dispatch walk aligned.
    auto entry = std::find_if(entries.begin(), entries.end(),
                              [id](const ListenerEntry& candidate) { return candidate.id == id; });
    if (entry == entries.end()) {
        return;
    }
    entries.erase(entry);
    if (entries.empty()) {
        if (dispatchDepth_ == 0) {
            listeners_.erase(it);
        } else {
            sweepPending_ = true;
        }
    }
}

void ReactiveHub::invoke(const std::string& key, const Listener& listener) {
    ++invocationCount_;
    try {
        listener();
    } catch (const std::exception& ex) {
        ++errorCount_;
        common::metrics::Registry::instance().incrementCounter("hub.listener_errors");
        LOG_ERR("Listener for " << key << " threw: " << ex.what());
    } catch (...) {
        ++errorCount_;
        common::metrics::Registry::instance().incrementCounter("hub.listener_errors");
        LOG_ERR("Listener for " << key << " threw a non-standard exception");
    }
}

void ReactiveHub::notifyKey(const std::string& key) {
    ++notificationCount_;

    auto it = listeners_.find(key);
    if (it != listeners_.end() && !it->second.empty()) {
        DispatchGuard guard(*this);
        auto& entries = it->second;
        if (entries.size() == 1) {
            const Listener callback = entries.front().callback;
            invoke(key, callback);
        } else {
            for (std::size_t i = 0; i < entries.size();) {
                const std::uint64_t id = entries[i].id;
                const Listener callback = entries[i].callback;
                invoke(key, callback);
                // A listener removed at or before i shifted the rest down.
                if (i < entries.size() && entries[i].id == id) {
                    ++i;
                }
            }
        }
    }

    if (notificationCount_ % config_.hubMaintenanceInterval == 0) {
        runMaintenance();
    }
}

void ReactiveHub::clearListeners() {
    if (dispatchDepth_ == 0) {
        listeners_.clear();
    } else {
        for (auto& entry : listeners_) {
            entry.second.clear();
        }
        sweepPending_ = true;
    }
    invocationCount_ = 0;
    errorCount_ = 0;
    LOG_DEBUG("All listeners cleared");
}

void ReactiveHub::forceCleanup() {
    if (dispatchDepth_ != 0) {
        sweepPending_ = true;
        return;
    }
    sweepEmptyKeys();
}

void ReactiveHub::sweepEmptyKeys() {
    std::size_t removed = 0;
    for (auto it = listeners_.begin(); it != listeners_.end();) {
        if (it->second.empty()) {
            it = listeners_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    sweepPending_ = false;
    if (removed != 0) {
        LOG_DEBUG("Removed " << removed << " empty listener keys");
    }
}

void ReactiveHub::runMaintenance() {
    if (dispatchDepth_ == 0) {
        sweepEmptyKeys();
    }
    const HealthStatus health = getHealthStatus();
    auto& registry = common::metrics::Registry::instance();
    registry.setGauge("hub.keys", static_cast<double>(health.stats.totalKeys));
    registry.setGauge("hub.listeners", static_cast<double>(health.stats.totalListeners));
    if (health.status != HealthLevel::Healthy) {
        LOG_WARN("Reactive hub " << toString(health.status) << ": pressure=" << toString(health.memoryPressure)
                                 << " errorRate=" << health.errorRate);
    }
}

MemoryStats ReactiveHub::getMemoryStats() const {
    MemoryStats stats;
    stats.totalKeys = listeners_.size();
    for (const auto& entry : listeners_) {
        const std::size_t count = entry.second.size();
        stats.totalListeners += count;
        stats.maxListenersPerKey = std::max(stats.maxListenersPerKey, count);
        if (count == 0) {
            ++stats.emptyKeys;
        }
    }
    stats.notificationCount = notificationCount_;
    stats.errorCount = errorCount_;
    return stats;
}

HealthStatus ReactiveHub::getHealthStatus() const {
    HealthStatus health;
    health.stats = getMemoryStats();
    const MemoryStats& stats = health.stats;

    if (stats.maxListenersPerKey >= config_.hubCriticalListenersPerKey ||
        stats.totalListeners >= config_.hubCriticalTotalListeners) {
        health.memoryPressure = MemoryPressure::High;
    } else if (stats.maxListenersPerKey >= config_.hubWarnListenersPerKey ||
               stats.totalListeners >= config_.hubWarnTotalListeners) {
        health.memoryPressure = MemoryPressure::Medium;
    }

    const double rate =
        invocationCount_ == 0 ? 0.0 : static_cast<double>(errorCount_) * 100.0 / static_cast<double>(invocationCount_);
    std::ostringstream rateText;
    rateText << std::fixed << std::setprecision(2) << rate << '%';
    health.errorRate = rateText.str();

    if (health.memoryPressure == MemoryPressure::High || rate >= config_.hubCriticalErrorRatePct) {
        health.status = HealthLevel::Critical;
    } else if (health.memoryPressure == MemoryPressure::Medium || rate >= config_.hubWarnErrorRatePct) {
        health.status = HealthLevel::Warning;
    }

    if (stats.maxListenersPerKey >= config_.hubWarnListenersPerKey) {
        health.recommendations.push_back("A key holds " + std::to_string(stats.maxListenersPerKey) +
                                         " listeners; check for subscriptions that are never disposed");
    }
    if (stats.totalListeners >= config_.hubWarnTotalListeners) {
        health.recommendations.push_back("Total listener count is " + std::to_string(stats.totalListeners) +
                                         "; dispose subscriptions of inactive scopes");
    }
    if (rate >= config_.hubWarnErrorRatePct) {
        health.recommendations.push_back("Listener error rate is " + health.errorRate +
                                         "; inspect the failing listeners in the log");
    }
    if (stats.emptyKeys != 0) {
        health.recommendations.push_back("Run forceCleanup() to drop " + std::to_string(stats.emptyKeys) +
                                         " empty keys");
    }
    return health;
}

std::string ReactiveHub::dumpListeners() const {
    if (listeners_.empty()) {
        return "No active listeners";
    }

    std::vector<std::pair<std::string, std::size_t>> rows;
    rows.reserve(listeners_.size());
    for (const auto& entry : listeners_) {
        rows.emplace_back(entry.first, entry.second.size());
    }
    std::sort(rows.begin(), rows.end());

    const MemoryStats stats = getMemoryStats();
    std::ostringstream out;
    out << "=== REACTIVE SYSTEM STATE ===\n";
    out << "Keys: " << stats.totalKeys << ", listeners: " << stats.totalListeners
        << ", notifications: " << stats.notificationCount << ", errors: " << stats.errorCount << '\n';
    for (const auto& row : rows) {
        out << "  " << row.first << ": " << row.second << (row.second == 1 ? " listener" : " listeners") << '\n';
    }
    return out.str();
}

std::size_t ReactiveHub::listenerCount(const std::string& key) const {
    auto it = listeners_.find(key);
    return it == listeners_.end() ? 0 : it->second.size();
}

}  // namespace zen::reactive
