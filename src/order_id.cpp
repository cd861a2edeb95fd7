// =============================================================================
// order_id.cpp - Deterministic order identifiers (SHA-256)
// =============================================================================

#include "tickbook/order_id.hpp"

#include <openssl/evp.h>
#include <vector>

namespace tickbook {

namespace {

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v >> 24));
    out.push_back(static_cast<uint8_t>(v >> 16));
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

void put_address(std::vector<uint8_t>& out, const Address& addr) {
    out.insert(out.end(), addr.begin(), addr.end());
}

// Fixed-width big-endian encoding of every field; no two distinct inputs
// share an encoding.
std::vector<uint8_t> encode(const PoolKey& key, int32_t tick, bool zero_for_one) {
    std::vector<uint8_t> out;
    out.reserve(3 * 20 + 3 * 4 + 1);
    put_address(out, key.currency0.addr);
    put_address(out, key.currency1.addr);
    put_u32(out, key.fee);
    put_u32(out, static_cast<uint32_t>(key.tick_spacing));
    put_address(out, key.hooks);
    put_u32(out, static_cast<uint32_t>(tick));
    out.push_back(zero_for_one ? 1 : 0);
    return out;
}

} // anonymous namespace

OrderId derive_order_id(const PoolKey& key, int32_t tick, bool zero_for_one) {
    std::vector<uint8_t> preimage = encode(key, tick, zero_for_one);

    OrderId id;
    unsigned int len = 0;
    if (EVP_Digest(preimage.data(), preimage.size(), id.bytes.data(), &len,
                   EVP_sha256(), nullptr) != 1 || len != id.bytes.size()) {
        throw Error(errors::CRYPTO_FAILURE, "SHA-256 digest failed");
    }
    return id;
}

std::string OrderId::to_hex() const {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace tickbook
