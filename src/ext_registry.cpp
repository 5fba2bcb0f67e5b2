/**
 * @file ext_registry.cpp
 * @brief Extension type registry.
 */

#include <msgunpack/ext_registry.hpp>

#include <utility>

namespace msgunpack {

void ExtRegistry::register_type(std::int8_t type, ExtType entry) {
    types_.insert_or_assign(type, std::move(entry));
}

bool ExtRegistry::unregister_type(std::int8_t type) {
    return types_.erase(type) > 0;
}

const ExtType* ExtRegistry::find(std::int8_t type) const noexcept {
    auto it = types_.find(type);
    if (it == types_.end()) {
        return nullptr;
    }
    return &it->second;
}

ExtRegistry& ext_registry() noexcept {
    static ExtRegistry registry;
    return registry;
}

} // namespace msgunpack
