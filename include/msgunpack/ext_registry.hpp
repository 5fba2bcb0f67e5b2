/**
 * @file ext_registry.hpp
 * @brief Process-wide table of application extension types.
 *
 * Applications register a decode function per extension type identifier
 * once, before decoding starts. The unpacker only reads the table. Per-call
 * handlers in UnpackOptions take precedence over entries found here, and
 * types found in neither place decode to a raw Ext.
 */

#ifndef MSGUNPACK_EXT_REGISTRY_HPP
#define MSGUNPACK_EXT_REGISTRY_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

#include "value.hpp"

namespace msgunpack {

/**
 * @brief Registered extension type.
 *
 * An entry without an unpack function is legal; decoding its type
 * fails with Error::NotImplemented.
 */
struct ExtType {
    std::string name;
    std::function<Value(const Binary&)> unpack;
};

/**
 * @brief Extension type table keyed by type identifier.
 *
 * Not thread-safe. Populate it before decoding begins.
 */
class ExtRegistry {
public:
    /**
     * @brief Register or replace the entry for a type identifier.
     */
    void register_type(std::int8_t type, ExtType entry);

    /**
     * @brief Remove the entry for a type identifier.
     * @return true if an entry was removed
     */
    bool unregister_type(std::int8_t type);

    /**
     * @brief Find the entry for a type identifier.
     * @return Pointer to the entry, or nullptr if none is registered
     */
    const ExtType* find(std::int8_t type) const noexcept;

    void clear() noexcept { types_.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return types_.size(); }

private:
    std::map<std::int8_t, ExtType> types_;
};

/**
 * @brief The process-wide registry consulted by the unpacker.
 */
ExtRegistry& ext_registry() noexcept;

} // namespace msgunpack

#endif // MSGUNPACK_EXT_REGISTRY_HPP
