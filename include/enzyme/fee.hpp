#ifndef ENZYME_FEE_HPP
#define ENZYME_FEE_HPP

#include <algorithm>
#include <memory>
#include <variant>
#include <vector>

#include "fee_ledger.hpp"
#include "types.hpp"

namespace enzyme {

// =============================================================================
// Fee Hooks (capability declaration)
// =============================================================================

struct FeeHooks {
    std::vector<Hook> settle;      // hooks that trigger settle()
    std::vector<Hook> update;      // hooks that trigger update()
    bool uses_gav_on_settle = false;
    bool uses_gav_on_update = false;

    bool settles_on(Hook hook) const {
        return std::find(settle.begin(), settle.end(), hook) != settle.end();
    }

    bool updates_on(Hook hook) const {
        return std::find(update.begin(), update.end(), hook) != update.end();
    }
};

// =============================================================================
// Fee Settings
// =============================================================================

struct ManagementFeeSettings {
    U256 scaled_per_second_rate = 0;  // ray, >= RAY
    SettlementPolicy policy = SettlementPolicy::MINT;
};

struct PerformanceFeeSettings {
    U256 rate = 0;        // wad fraction of value above the high-water mark
    uint64_t period = 0;  // crystallization period, seconds
};

struct EntranceRateFeeSettings {
    U256 rate = 0;        // wad fraction of shares bought
};

struct FeeSettings {
    FeeKind kind = FeeKind::MANAGEMENT;
    std::variant<ManagementFeeSettings, PerformanceFeeSettings, EntranceRateFeeSettings> params;

    static FeeSettings management(const U256& scaled_per_second_rate,
                                  SettlementPolicy policy = SettlementPolicy::MINT) {
        return {FeeKind::MANAGEMENT, ManagementFeeSettings{scaled_per_second_rate, policy}};
    }

    static FeeSettings performance(const U256& rate, uint64_t period) {
        return {FeeKind::PERFORMANCE, PerformanceFeeSettings{rate, period}};
    }

    static FeeSettings entrance_rate_burn(const U256& rate) {
        return {FeeKind::ENTRANCE_RATE_BURN, EntranceRateFeeSettings{rate}};
    }

    static FeeSettings entrance_rate_direct(const U256& rate) {
        return {FeeKind::ENTRANCE_RATE_DIRECT, EntranceRateFeeSettings{rate}};
    }
};

// =============================================================================
// IFee - settlement engine for one fee kind
// =============================================================================
//
// Each fee owns its per-fund ledger. Every mutating call must come from the
// fee manager address the fee was constructed with.

class IFee {
public:
    virtual ~IFee() = default;

    virtual FeeKind kind() const = 0;
    virtual const Address& address() const = 0;
    virtual const Address& fee_manager() const = 0;
    virtual FeeHooks implemented_hooks() const = 0;

    // One-time per fund
    virtual void add_fund_settings(const Address& caller, const FundId& fund, const FeeSettings& settings) = 0;

    // Called once right after configuration
    virtual void activate_for_fund(const Address& caller, const FundId& fund, const FundView& view) = 0;

    virtual SettlementInstruction settle(const Address& caller, const FundId& fund, const FundView& view,
                                         Hook hook, const HookPayload& payload) = 0;

    virtual void update(const Address& caller, const FundId& fund, const FundView& view,
                        Hook hook, const HookPayload& payload) = 0;

    // Releases shares outstanding if the fee allows it now; 0 means no transfer
    virtual U256 payout(const Address& caller, const FundId& fund, uint64_t now) = 0;

    // Releases shares outstanding unconditionally (migration)
    virtual U256 force_payout(const Address& caller, const FundId& fund, uint64_t now) = 0;

    virtual bool is_configured(const FundId& fund) const = 0;
    virtual FeeLedgerEntry fee_info(const FundId& fund) const = 0;
    virtual U256 shares_outstanding(const FundId& fund) const = 0;

    virtual std::unique_ptr<FeeCheckpoint> checkpoint(const Address& caller, const FundId& fund) = 0;
};

} // namespace enzyme

#endif // ENZYME_FEE_HPP
