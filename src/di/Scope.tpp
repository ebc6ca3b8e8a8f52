#pragma once

#include <stdexcept>
#include <type_traits>

#include "core/Controller.hpp"
#include "core/Errors.hpp"
#include "core/IDisposable.hpp"

namespace zen::di {

template <typename T>
Scope::Binding Scope::makeBinding(std::shared_ptr<T> instance) {
    using Plain = std::remove_cv_t<T>;
    auto* raw = const_cast<Plain*>(instance.get());

    Binding binding{kNoInstance, core::typeKey<T>(), std::shared_ptr<void>(), nullptr, nullptr, false};
    if constexpr (std::is_base_of_v<core::IDisposable, Plain>) {
        binding.disposable = raw;
    } else if constexpr (std::is_polymorphic_v<Plain>) {
        binding.disposable = dynamic_cast<core::IDisposable*>(raw);
    }
    if constexpr (std::is_base_of_v<core::Controller, Plain>) {
        binding.controller = raw;
        binding.service = std::is_base_of_v<core::Service, Plain>;
    } else if constexpr (std::is_polymorphic_v<Plain>) {
        binding.controller = dynamic_cast<core::Controller*>(raw);
        binding.service = dynamic_cast<core::Service*>(raw) != nullptr;
    }
    binding.instance = std::shared_ptr<void>(std::const_pointer_cast<Plain>(std::move(instance)));
    return binding;
}

template <typename T>
std::shared_ptr<T> Scope::put(std::shared_ptr<T> instance,
                              const std::optional<std::string>& tag,
                              bool permanent,
                              const std::vector<InstanceId>& declaredDeps) {
    ensureActive("put");
    if (!instance) {
        throw std::invalid_argument("Cannot put a null " + core::qualifiedKey(core::typeKey<T>().name, tag));
    }
    bindInstance(makeBinding<T>(instance), tag, permanent, declaredDeps);
    return instance;
}

template <typename T>
void Scope::lazily(Factory<T> factory,
                   const std::optional<std::string>& tag,
                   std::vector<InstanceId> declaredDeps,
                   bool permanent) {
    ensureActive("lazily");
    if (!factory) {
        throw std::invalid_argument("Empty lazy factory for " + core::qualifiedKey(core::typeKey<T>().name, tag));
    }
    FactoryEntry entry{core::typeKey<T>(),
                       [factory = std::move(factory)]() { return makeBinding<T>(factory()); },
                       std::move(declaredDeps),
                       false,
                       permanent};
    registerFactory(BindingKey{core::typeKey<T>().index, tag}, std::move(entry),
                    permanent ? kPermanentUseCount : 0);
}

template <typename T>
void Scope::putFactory(Factory<T> factory, const std::optional<std::string>& tag) {
    ensureActive("putFactory");
    if (!factory) {
        throw std::invalid_argument("Empty factory for " + core::qualifiedKey(core::typeKey<T>().name, tag));
    }
    FactoryEntry entry{core::typeKey<T>(),
                       [factory = std::move(factory)]() { return makeBinding<T>(factory()); },
                       {},
                       true,
                       false};
    registerFactory(BindingKey{core::typeKey<T>().index, tag}, std::move(entry), kAlwaysNewUseCount);
}

template <typename T>
std::shared_ptr<T> Scope::find(const std::optional<std::string>& tag) {
    for (Scope* scope = this; scope != nullptr; scope = scope->parent_) {
        if (scope->disposed_) {
            return nullptr;
        }
        if (auto found = scope->resolveLocal(core::typeKey<T>(), tag)) {
            return std::static_pointer_cast<T>(found);
        }
    }
    return nullptr;
}

template <typename T>
std::shared_ptr<T> Scope::findInThisScope(const std::optional<std::string>& tag) {
    return std::static_pointer_cast<T>(resolveLocal(core::typeKey<T>(), tag));
}

template <typename T>
std::shared_ptr<T> Scope::findRequired(const std::optional<std::string>& tag) {
    auto found = find<T>(tag);
    if (!found) {
        throw core::DependencyNotFoundError(core::typeKey<T>().name, tag, displayName());
    }
    return found;
}

template <typename T>
bool Scope::exists(const std::optional<std::string>& tag) const {
    const BindingKey key{core::typeKey<T>().index, tag};
    for (const Scope* scope = this; scope != nullptr; scope = scope->parent_) {
        if (scope->disposed_) {
            return false;
        }
        if (scope->hasLocal(key)) {
            return true;
        }
    }
    return false;
}

template <typename T>
bool Scope::contains(const std::optional<std::string>& tag) const {
    return !disposed_ && hasLocal(BindingKey{core::typeKey<T>().index, tag});
}

template <typename T>
bool Scope::remove(const std::optional<std::string>& tag, bool force) {
    ensureActive("remove");
    return eraseBinding(BindingKey{core::typeKey<T>().index, tag}, force);
}

template <typename T>
int Scope::incrementUseCount(const std::optional<std::string>& tag) {
    ensureActive("incrementUseCount");
    return adjustUseCount(BindingKey{core::typeKey<T>().index, tag}, 1,
                          core::qualifiedKey(core::typeKey<T>().name, tag));
}

template <typename T>
int Scope::decrementUseCount(const std::optional<std::string>& tag) {
    ensureActive("decrementUseCount");
    return adjustUseCount(BindingKey{core::typeKey<T>().index, tag}, -1,
                          core::qualifiedKey(core::typeKey<T>().name, tag));
}

template <typename T>
std::optional<int> Scope::useCount(const std::optional<std::string>& tag) const {
    return lookupUseCount(BindingKey{core::typeKey<T>().index, tag});
}

template <typename T>
bool Scope::isPermanent(const std::optional<std::string>& tag) const {
    return useCount<T>(tag) == kPermanentUseCount;
}

template <typename T>
std::optional<InstanceId> Scope::handleOf(const std::optional<std::string>& tag) const {
    return lookupHandle(BindingKey{core::typeKey<T>().index, tag});
}

}  // namespace zen::di
