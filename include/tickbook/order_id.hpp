#ifndef TICKBOOK_ORDER_ID_HPP
#define TICKBOOK_ORDER_ID_HPP

#include <array>
#include <string>

#include "types.hpp"

namespace tickbook {

// =============================================================================
// Order Identifier
// =============================================================================

// SHA-256 of (pool key, usable tick, direction). Joins an order bucket to its
// claim accounting; identical inputs always map to the same id.
struct OrderId {
    std::array<uint8_t, 32> bytes{};

    bool operator==(const OrderId& other) const { return bytes == other.bytes; }
    bool operator!=(const OrderId& other) const { return bytes != other.bytes; }
    bool operator<(const OrderId& other) const { return bytes < other.bytes; }

    std::string to_hex() const;
};

// Pure; callable by anyone. The tick is used as given (callers normalize).
OrderId derive_order_id(const PoolKey& key, int32_t tick, bool zero_for_one);

} // namespace tickbook

#endif // TICKBOOK_ORDER_ID_HPP
