#ifndef PEG_TYPES_HPP
#define PEG_TYPES_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace peg {

// =============================================================================
// Integer Types
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

// Account identity (caller address)
using AccountId = Address;

namespace addresses {

constexpr Address ZERO = {};

// Helper to create an address whose low 8 bytes hold `n`
constexpr Address from_u64(uint64_t n) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// Parse "0x"-prefixed (or bare) 40-digit hex; throws ValidationError
Address from_hex(std::string_view hex);

// Lower-case "0x"-prefixed hex
std::string to_hex(const Address& addr);

} // namespace addresses

// =============================================================================
// Collateral Asset Identifier (Token Address)
// =============================================================================

struct AssetId {
    Address addr;

    AssetId() : addr{} {}
    explicit AssetId(const Address& a) : addr(a) {}

    static AssetId from_hex(std::string_view hex) { return AssetId(addresses::from_hex(hex)); }
    std::string to_hex() const { return addresses::to_hex(addr); }

    bool operator==(const AssetId& other) const { return addr == other.addr; }
    bool operator!=(const AssetId& other) const { return addr != other.addr; }
    bool operator<(const AssetId& other) const { return addr < other.addr; }
};

// =============================================================================
// Price Feed Identifier (Aggregator Address)
// =============================================================================

struct PriceFeedId {
    Address addr;

    PriceFeedId() : addr{} {}
    explicit PriceFeedId(const Address& a) : addr(a) {}

    static PriceFeedId from_hex(std::string_view hex) { return PriceFeedId(addresses::from_hex(hex)); }
    std::string to_hex() const { return addresses::to_hex(addr); }

    bool operator==(const PriceFeedId& other) const { return addr == other.addr; }
    bool operator!=(const PriceFeedId& other) const { return addr != other.addr; }
    bool operator<(const PriceFeedId& other) const { return addr < other.addr; }
};

} // namespace peg

#endif // PEG_TYPES_HPP
