#pragma once

#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>

namespace zen::core {

// Identity of a bound C++ type: the type_index is used for lookups, the name for
// logs, listener keys and error messages.
struct TypeKey {
    std::type_index index;
    std::string name;

    bool operator==(const TypeKey& other) const noexcept { return index == other.index; }
    bool operator!=(const TypeKey& other) const noexcept { return index != other.index; }
};

std::string readableTypeName(const std::type_info& info);

// "Type" or "Type:tag". Shared by use-count logs and reactive listener keys.
std::string qualifiedKey(const std::string& typeName, const std::optional<std::string>& tag);

template <typename T>
const TypeKey& typeKey() {
    static const TypeKey key{std::type_index(typeid(T)), readableTypeName(typeid(T))};
    return key;
}

}  // namespace zen::core
