#ifndef ENZYME_ENTRANCE_RATE_FEE_HPP
#define ENZYME_ENTRANCE_RATE_FEE_HPP

#include "fee.hpp"

namespace enzyme {

// =============================================================================
// EntranceRateFee - fixed fraction of the shares each buyer receives
// =============================================================================
//
// Settles on POST_BUY_SHARES. ENTRANCE_RATE_BURN burns the fee shares from
// the buyer (benefiting remaining holders); ENTRANCE_RATE_DIRECT transfers
// them from the buyer to the fee recipient.

struct EntranceRateFeeInfo {
    U256 rate = 0;  // wad
    uint64_t last_settled = 0;
};

class EntranceRateFee : public IFee {
public:
    // kind must be ENTRANCE_RATE_BURN or ENTRANCE_RATE_DIRECT
    EntranceRateFee(FeeKind kind, const Address& self, const Address& fee_manager);

    FeeKind kind() const override { return kind_; }
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

    std::unique_ptr<FeeCheckpoint> checkpoint(const Address& caller, const FundId& fund) override;

private:
    FeeKind kind_;
    SettlementType settlement_type_;
    Address self_;
    Address fee_manager_;
    FeeLedger<EntranceRateFeeInfo> ledger_;
};

} // namespace enzyme

#endif // ENZYME_ENTRANCE_RATE_FEE_HPP
