#pragma once

#include <stdexcept>
#include <utility>

#include "core/TypeKey.hpp"

namespace zen::reactive {

template <typename T>
std::string ReactiveHub::keyFor(const std::optional<std::string>& tag) {
    return core::qualifiedKey(core::typeKey<T>().name, tag);
}

template <typename T>
ReactiveHub::Subscription ReactiveHub::listen(std::function<void(std::shared_ptr<T>)> callback,
                                              const std::optional<std::string>& tag) {
    return subscribe<T>(tag, std::move(callback));
}

template <typename T>
ReactiveHub::Subscription ReactiveHub::listen(const std::string& providerKey,
                                              std::function<void(std::shared_ptr<T>)> callback) {
    return subscribe<T>(tagFromProviderKey(core::typeKey<T>().name, providerKey), std::move(callback));
}

template <typename T>
ReactiveHub::Subscription ReactiveHub::subscribe(const std::optional<std::string>& tag,
                                                 std::function<void(std::shared_ptr<T>)> callback) {
    if (!callback) {
        throw std::invalid_argument("Cannot listen to " + keyFor<T>(tag) + " with an empty callback");
    }
    di::ScopeManager* scopes = &scopes_;
    Listener listener = [scopes, tag, callback = std::move(callback)]() {
        callback(scopes->currentScope()->template find<T>(tag));
    };

    const std::string key = keyFor<T>(tag);
    Subscription subscription = addListener(key, listener);
    invoke(key, listener);
    return subscription;
}

template <typename T>
void ReactiveHub::notifyListeners(const std::optional<std::string>& tag) {
    notifyKey(keyFor<T>(tag));
}

}  // namespace zen::reactive
