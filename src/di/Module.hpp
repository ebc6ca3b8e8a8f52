#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

namespace zen::di {

class Scope;

// Group of related bindings loaded as a unit by ModuleRegistry. Modules are
// identified by name; two instances with the same name are the same module.
class Module {
public:
    virtual ~Module() = default;

    virtual std::string name() const = 0;

    // Modules that must be loaded first.
    virtual std::vector<std::shared_ptr<Module>> dependencies() const { return {}; }

    virtual void registerBindings(Scope& scope) = 0;

    // The registry blocks on the returned future before loading the next module.
    virtual std::future<void> onInit(Scope& scope);
    virtual std::future<void> onDispose(Scope& scope);

    bool operator==(const Module& other) const { return name() == other.name(); }
    bool operator!=(const Module& other) const { return !(*this == other); }

protected:
    static std::future<void> ready();
};

}  // namespace zen::di
