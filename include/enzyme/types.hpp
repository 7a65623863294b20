#ifndef ENZYME_TYPES_HPP
#define ENZYME_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <optional>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace enzyme {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

// A fund is identified by its stable address; it survives migration.
using FundId = Address;

namespace addresses {

// Helper to create a small well-known address (last two bytes)
constexpr Address from_u16(uint16_t n) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((n >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(n & 0xFF);
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// Parse "0x" + 40 hex chars. Throws std::invalid_argument.
Address from_hex(std::string_view hex);

// from_u16 for an id read from outside. Throws std::invalid_argument above 0xFFFF.
Address from_id(uint64_t id);
std::string to_hex(const Address& addr);

struct Hash {
    size_t operator()(const Address& addr) const {
        uint64_t h = 0;
        for (auto b : addr) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

} // namespace addresses

// =============================================================================
// Fixed-Point Arithmetic (WAD = 1e18, RAY = 1e27)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

// 256-bit unsigned with overflow detection: overflow raises std::overflow_error,
// negative results raise std::range_error.
using U256 = boost::multiprecision::checked_uint256_t;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18

inline const U256 WAD{1000000000000000000ULL};                  // 1e18
inline const U256 RAY = WAD * 1000000000ULL;                    // 1e27
inline const U256 WAD_TO_RAY{1000000000ULL};                    // 1e9

// Shares carry 18 decimals
inline const U256 SHARE_UNIT = WAD;

constexpr uint64_t SECONDS_PER_YEAR = 31536000;

// Highest accepted annual management rate (10000% a year)
constexpr I128 MAX_ANNUAL_RATE_X18 = 100 * X18_ONE;

namespace wad {

// Exact decimal -> wad conversion ("0.1" -> 1e17). Throws std::invalid_argument.
U256 from_string(std::string_view s);

// Wad -> decimal string, trailing zeros trimmed ("100000000000000000" -> "0.1")
std::string to_string(const U256& v);

inline U256 from_int(uint64_t v) {
    return U256(v) * WAD;
}

} // namespace wad

// Lossless conversions between the 128-bit signed domain and U256.
// to_u256 throws std::range_error for negative input, to_i128 throws
// std::overflow_error when the value does not fit.
U256 to_u256(I128 v);
I128 to_i128(const U256& v);

// =============================================================================
// Fee Kinds, Hooks, Settlement Types
// =============================================================================

enum class FeeKind : uint8_t {
    MANAGEMENT = 0,
    PERFORMANCE = 1,
    ENTRANCE_RATE_BURN = 2,
    ENTRANCE_RATE_DIRECT = 3
};

enum class Hook : uint8_t {
    CONTINUOUS = 0,
    PRE_BUY_SHARES = 1,
    POST_BUY_SHARES = 2,
    PRE_REDEEM_SHARES = 3
};

enum class SettlementType : uint8_t {
    NONE = 0,
    DIRECT = 1,
    MINT = 2,
    BURN = 3,
    MINT_SHARES_OUTSTANDING = 4,
    BURN_SHARES_OUTSTANDING = 5
};

// How a fee kind realises the shares it is due
enum class SettlementPolicy : uint8_t {
    MINT = 0,                    // mint straight to the fee recipient
    MINT_SHARES_OUTSTANDING = 1  // mint to the vault, pay out later
};

const char* to_string(FeeKind kind);
const char* to_string(Hook hook);
const char* to_string(SettlementType type);

// Throws std::invalid_argument for unknown names
FeeKind fee_kind_from_string(std::string_view name);

// =============================================================================
// Settlement Instruction
// =============================================================================

struct SettlementInstruction {
    SettlementType type = SettlementType::NONE;
    Address payer{};   // DIRECT / BURN only
    U256 shares_due = 0;

    static SettlementInstruction none() { return {}; }
};

struct AppliedInstruction {
    FeeKind kind;
    SettlementInstruction instruction;
};

// =============================================================================
// Hook Payload and Fund View
// =============================================================================

// Data the fund's lifecycle controller attaches to a hook
struct HookPayload {
    Address investor{};          // buyer or redeemer
    U256 investment_amount = 0;  // PRE/POST_BUY_SHARES
    U256 shares_bought = 0;      // POST_BUY_SHARES
    U256 shares_redeemed = 0;    // PRE_REDEEM_SHARES
    std::optional<U256> gav;     // gross asset value, if already known
};

// Vault state as seen by a single fee call
struct FundView {
    U256 shares_supply = 0;
    U256 shares_outstanding = 0;  // shares held by the vault itself
    std::optional<U256> gav;
    uint64_t now = 0;

    U256 net_shares_supply() const {
        return shares_supply > shares_outstanding ? U256(shares_supply - shares_outstanding) : U256(0);
    }
};

// =============================================================================
// Fee Ledger Entry
// =============================================================================

// rate is kind specific: ray growth factor per second for the management fee,
// wad fraction for the performance and entrance fees.
struct FeeLedgerEntry {
    U256 rate = 0;
    uint64_t last_settled = 0;

    bool operator==(const FeeLedgerEntry& other) const {
        return rate == other.rate && last_settled == other.last_settled;
    }
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t RATE_OUT_OF_RANGE = -1;
constexpr int32_t ARITHMETIC_OVERFLOW = -2;
constexpr int32_t ALREADY_CONFIGURED = -3;
constexpr int32_t NOT_MONOTONIC = -4;
constexpr int32_t UNKNOWN_FEE_KIND = -5;
constexpr int32_t FUND_NOT_INITIALIZED = -6;
constexpr int32_t INVALID_SETTINGS = -8;
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t VALUE_DUE_EXCEEDS_GAV = -11;
constexpr int32_t ORACLE_SOURCE_UNAVAILABLE = -21;
constexpr int32_t INVALID_CONFIG = -22;
constexpr int32_t UNAUTHORIZED = -40;
}

} // namespace enzyme

#endif // ENZYME_TYPES_HPP
