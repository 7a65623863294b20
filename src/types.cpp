// =============================================================================
// types.cpp - Address, wad and enum helpers
// =============================================================================

#include "enzyme/types.hpp"
#include "enzyme/errors.hpp"

#include <limits>
#include <stdexcept>

namespace enzyme {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

constexpr size_t WAD_DECIMALS = 18;

} // namespace

// =============================================================================
// Addresses
// =============================================================================

Address addresses::from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw std::invalid_argument("address must be 20 bytes of hex: " + std::string(hex));
    }

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in address: " + std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

Address addresses::from_id(uint64_t id) {
    if (id > 0xFFFF) {
        throw std::invalid_argument("address id out of range: " + std::to_string(id));
    }
    return from_u16(static_cast<uint16_t>(id));
}

std::string addresses::to_hex(const Address& addr) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

// =============================================================================
// Wad
// =============================================================================

U256 wad::from_string(std::string_view s) {
    if (s.empty()) {
        throw std::invalid_argument("empty decimal");
    }

    U256 whole = 0;
    U256 frac = 0;
    size_t frac_digits = 0;
    bool seen_point = false;
    bool seen_digit = false;

    for (char c : s) {
        if (c == '.') {
            if (seen_point) throw std::invalid_argument("invalid decimal: " + std::string(s));
            seen_point = true;
            continue;
        }
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid decimal: " + std::string(s));
        }
        seen_digit = true;
        unsigned digit = static_cast<unsigned>(c - '0');
        if (seen_point) {
            if (++frac_digits > WAD_DECIMALS) {
                throw std::invalid_argument("more than 18 decimals: " + std::string(s));
            }
            frac = frac * 10 + digit;
        } else {
            whole = whole * 10 + digit;
        }
    }
    if (!seen_digit) {
        throw std::invalid_argument("invalid decimal: " + std::string(s));
    }

    for (size_t i = frac_digits; i < WAD_DECIMALS; ++i) {
        frac *= 10;
    }
    return whole * WAD + frac;
}

std::string wad::to_string(const U256& v) {
    U256 whole = v / WAD;
    U256 frac = v % WAD;
    std::string out = whole.str();
    if (frac == 0) return out;

    std::string frac_str = frac.str();
    frac_str.insert(0, WAD_DECIMALS - frac_str.size(), '0');
    while (!frac_str.empty() && frac_str.back() == '0') frac_str.pop_back();
    return out + "." + frac_str;
}

// =============================================================================
// 128 <-> 256 bit conversions
// =============================================================================

U256 to_u256(I128 v) {
    if (v < 0) {
        throw std::range_error("negative value cannot be represented as U256");
    }
    U128 u = static_cast<U128>(v);
    U256 hi{static_cast<uint64_t>(u >> 64)};
    U256 lo{static_cast<uint64_t>(u)};
    return (hi << 64) | lo;
}

I128 to_i128(const U256& v) {
    static const U256 max_i128 = (U256(1) << 127) - 1;
    if (v > max_i128) {
        throw std::overflow_error("value exceeds 128-bit signed range");
    }
    U256 hi_part = v >> 64;
    U256 lo_part = v & U256(std::numeric_limits<uint64_t>::max());
    U128 u = (static_cast<U128>(hi_part.convert_to<uint64_t>()) << 64) |
             static_cast<U128>(lo_part.convert_to<uint64_t>());
    return static_cast<I128>(u);
}

// =============================================================================
// Enum names
// =============================================================================

const char* to_string(FeeKind kind) {
    switch (kind) {
        case FeeKind::MANAGEMENT:           return "management";
        case FeeKind::PERFORMANCE:          return "performance";
        case FeeKind::ENTRANCE_RATE_BURN:   return "entrance_rate_burn";
        case FeeKind::ENTRANCE_RATE_DIRECT: return "entrance_rate_direct";
    }
    return "unknown";
}

const char* to_string(Hook hook) {
    switch (hook) {
        case Hook::CONTINUOUS:        return "continuous";
        case Hook::PRE_BUY_SHARES:    return "pre_buy_shares";
        case Hook::POST_BUY_SHARES:   return "post_buy_shares";
        case Hook::PRE_REDEEM_SHARES: return "pre_redeem_shares";
    }
    return "unknown";
}

const char* to_string(SettlementType type) {
    switch (type) {
        case SettlementType::NONE:                    return "none";
        case SettlementType::DIRECT:                  return "direct";
        case SettlementType::MINT:                    return "mint";
        case SettlementType::BURN:                    return "burn";
        case SettlementType::MINT_SHARES_OUTSTANDING: return "mint_shares_outstanding";
        case SettlementType::BURN_SHARES_OUTSTANDING: return "burn_shares_outstanding";
    }
    return "unknown";
}

FeeKind fee_kind_from_string(std::string_view name) {
    if (name == "management") return FeeKind::MANAGEMENT;
    if (name == "performance") return FeeKind::PERFORMANCE;
    if (name == "entrance_rate_burn") return FeeKind::ENTRANCE_RATE_BURN;
    if (name == "entrance_rate_direct") return FeeKind::ENTRANCE_RATE_DIRECT;
    throw std::invalid_argument("unknown fee kind: " + std::string(name));
}

// =============================================================================
// Access control
// =============================================================================

void require_caller(const Address& caller, const Address& expected, const char* what) {
    if (caller != expected) {
        throw UnauthorizedCallerError(std::string(what) + ": caller " + addresses::to_hex(caller) +
                                      " is not " + addresses::to_hex(expected));
    }
}

} // namespace enzyme
