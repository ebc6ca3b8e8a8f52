#pragma once

#include <functional>
#include <vector>

#include "core/IDisposable.hpp"

namespace zen::core {

// Object with an init -> ready -> close lifecycle. A scope drives initialize()
// and markReady() when the controller is bound and dispose() when the binding
// goes away.
class Controller : public IDisposable {
public:
    Controller() = default;
    ~Controller() override = default;

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    void initialize();
    void markReady();
    void dispose() override;

    // Cleanup callbacks run on dispose(), after onClose(), in registration order.
    void addDisposer(std::function<void()> disposer);

    bool isInitialized() const noexcept { return initialized_; }
    bool isReady() const noexcept { return ready_; }
    bool isDisposed() const override { return disposed_; }

protected:
    virtual void onInit() {}
    virtual void onReady() {}
    virtual void onClose() {}

private:
    bool initialized_{false};
    bool ready_{false};
    bool disposed_{false};
    std::vector<std::function<void()>> disposers_;
};

// Long-lived controller. Bindings of services are permanent regardless of the
// flag passed to Scope::put.
class Service : public Controller {};

}  // namespace zen::core
