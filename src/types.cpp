// =============================================================================
// types.cpp - Address Hex Conversion
// =============================================================================

#include "peg/types.hpp"
#include "peg/errors.hpp"

namespace peg {
namespace addresses {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

Address from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw ValidationError(ErrorCode::INVALID_CONFIG,
                              "address must be 40 hex digits: " + std::string(hex));
    }

    Address addr = {};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw ValidationError(ErrorCode::INVALID_CONFIG,
                                  "invalid hex digit in address: " + std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace addresses
} // namespace peg
