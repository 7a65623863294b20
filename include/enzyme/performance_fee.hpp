#ifndef ENZYME_PERFORMANCE_FEE_HPP
#define ENZYME_PERFORMANCE_FEE_HPP

#include "fee.hpp"

namespace enzyme {

// =============================================================================
// PerformanceFee - high-water-mark fee held as shares outstanding
// =============================================================================
//
// Value earned above the high-water mark accrues as "aggregate value due".
// Each settlement mints (or burns) shares held by the vault so that the
// outstanding shares are worth exactly the value due. Shares are released to
// the fee recipient by payout() at most once per crystallization period,
// which also lifts the high-water mark.

struct PerformanceFeeInfo {
    U256 rate = 0;                 // wad
    uint64_t period = 0;           // seconds
    uint64_t activated = 0;
    uint64_t last_paid = 0;
    U256 high_water_mark = 0;      // share price, SHARE_UNIT scale
    U256 last_share_price = 0;
    U256 aggregate_value_due = 0;  // denomination asset units
    uint64_t last_settled = 0;
};

class PerformanceFee : public IFee {
public:
    PerformanceFee(const Address& self, const Address& fee_manager);

    FeeKind kind() const override { return FeeKind::PERFORMANCE; }
    const Address& address() const override { return self_; }
    const Address& fee_manager() const override { return fee_manager_; }
    FeeHooks implemented_hooks() const override;

    void add_fund_settings(const Address& caller, const FundId& fund, const FeeSettings& settings) override;
    void activate_for_fund(const Address& caller, const FundId& fund, const FundView& view) override;

    SettlementInstruction settle(const Address& caller, const FundId& fund, const FundView& view,
                                 Hook hook, const HookPayload& payload) override;
    void update(const Address& caller, const FundId& fund, const FundView& view,
                Hook hook, const HookPayload& payload) override;

    U256 payout(const Address& caller, const FundId& fund, uint64_t now) override;
    U256 force_payout(const Address& caller, const FundId& fund, uint64_t now) override;

    // True once per crystallization period, after the first full period
    bool payout_allowed(const FundId& fund, uint64_t now) const;

    bool is_configured(const FundId& fund) const override { return ledger_.has_fund(fund); }
    FeeLedgerEntry fee_info(const FundId& fund) const override;
    U256 shares_outstanding(const FundId& fund) const override { return ledger_.shares_outstanding(fund); }

    PerformanceFeeInfo get_fee_info_for_fund(const FundId& fund) const { return ledger_.get(fund); }

    std::unique_ptr<FeeCheckpoint> checkpoint(const Address& caller, const FundId& fund) override;

private:
    U256 crystallize(const FundId& fund, uint64_t now);
    U256 next_share_price(const FundView& view, Hook hook, const HookPayload& payload) const;

    Address self_;
    Address fee_manager_;
    FeeLedger<PerformanceFeeInfo> ledger_;
};

} // namespace enzyme

#endif // ENZYME_PERFORMANCE_FEE_HPP
