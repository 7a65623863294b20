#ifndef ENZYME_MANAGEMENT_FEE_HPP
#define ENZYME_MANAGEMENT_FEE_HPP

#include "fee.hpp"

namespace enzyme {

// =============================================================================
// ManagementFee - time-based dilution at a fixed per-second rate
// =============================================================================
//
// Settles on CONTINUOUS, PRE_BUY_SHARES and PRE_REDEEM_SHARES. The first
// settlement only starts the clock; afterwards the fee is charged on the
// supply net of shares outstanding for the seconds since the last settlement.
// The rate cannot be changed once set.

struct ManagementFeeInfo {
    U256 scaled_per_second_rate = 0;
    SettlementPolicy policy = SettlementPolicy::MINT;
    uint64_t last_settled = 0;
};

class ManagementFee : public IFee {
public:
    ManagementFee(const Address& self, const Address& fee_manager);

    FeeKind kind() const override { return FeeKind::MANAGEMENT; }
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

    bool is_configured(const FundId& fund) const override { return ledger_.has_fund(fund); }
    FeeLedgerEntry fee_info(const FundId& fund) const override;
    U256 shares_outstanding(const FundId& fund) const override { return ledger_.shares_outstanding(fund); }

    ManagementFeeInfo get_fee_info_for_fund(const FundId& fund) const { return ledger_.get(fund); }

    std::unique_ptr<FeeCheckpoint> checkpoint(const Address& caller, const FundId& fund) override;

private:
    U256 release_outstanding(const FundId& fund);

    Address self_;
    Address fee_manager_;
    FeeLedger<ManagementFeeInfo> ledger_;
};

} // namespace enzyme

#endif // ENZYME_MANAGEMENT_FEE_HPP
