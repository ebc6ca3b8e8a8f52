#include "core/Errors.hpp"

namespace zen::core {
namespace {

std::string notFoundMessage(const std::string& typeName,
                            const std::optional<std::string>& tag,
                            const std::string& scopeName) {
    std::string message = "Dependency not found: " + typeName;
    if (tag) {
        message += " (tag=" + *tag + ")";
    }
    message += " in scope " + scopeName;
    return message;
}

}  // namespace

ScopeDisposedError::ScopeDisposedError(const std::string& scopeName, const std::string& operation)
    : ZenError("Cannot " + operation + " on disposed scope: " + scopeName),
      scopeName_(scopeName),
      operation_(operation) {}

CircularDependencyError::CircularDependencyError(const std::string& node)
    : ZenError("Circular dependency detected: " + node), node_(node) {}

DependencyNotFoundError::DependencyNotFoundError(const std::string& typeName,
                                                 const std::optional<std::string>& tag,
                                                 const std::string& scopeName)
    : ZenError(notFoundMessage(typeName, tag, scopeName)), typeName_(typeName), tag_(tag) {}

}  // namespace zen::core
