#pragma once

namespace zen::core {

// Disposal hook a bound instance may expose. Scopes call dispose() when the
// binding is replaced, removed or torn down.
class IDisposable {
public:
    virtual void dispose() = 0;
    virtual bool isDisposed() const = 0;
    virtual ~IDisposable() = default;
};

}  // namespace zen::core
