#include "core/TypeKey.hpp"

#include <boost/core/demangle.hpp>

namespace zen::core {

std::string readableTypeName(const std::type_info& info) {
    return boost::core::demangle(info.name());
}

std::string qualifiedKey(const std::string& typeName, const std::optional<std::string>& tag) {
    if (!tag) {
        return typeName;
    }
    std::string key;
    key.reserve(typeName.size() + tag->size() + 1);
    key.append(typeName);
    key.push_back(':');
    key.append(*tag);
    return key;
}

}  // namespace zen::core
