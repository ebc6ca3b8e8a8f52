#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace zen::core {

class ZenError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A mutating call reached a scope after dispose().
class ScopeDisposedError : public ZenError {
public:
    ScopeDisposedError(const std::string& scopeName, const std::string& operation);

    const std::string& scopeName() const noexcept { return scopeName_; }
    const std::string& operation() const noexcept { return operation_; }

private:
    std::string scopeName_;
    std::string operation_;
};

// Raised for cycles in the declared instance graph, in re-entrant factory
// resolution and in the module dependency graph. node() names the offender.
class CircularDependencyError : public ZenError {
public:
    explicit CircularDependencyError(const std::string& node);

    const std::string& node() const noexcept { return node_; }

private:
    std::string node_;
};

class DependencyNotFoundError : public ZenError {
public:
    DependencyNotFoundError(const std::string& typeName,
                            const std::optional<std::string>& tag,
                            const std::string& scopeName);

    const std::string& typeName() const noexcept { return typeName_; }
    const std::optional<std::string>& tag() const noexcept { return tag_; }

private:
    std::string typeName_;
    std::optional<std::string> tag_;
};

}  // namespace zen::core
