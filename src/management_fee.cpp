// =============================================================================
// management_fee.cpp - ManagementFee Implementation
// =============================================================================

#include "enzyme/management_fee.hpp"
#include "enzyme/log.hpp"
#include "enzyme/ray_math.hpp"

namespace enzyme {

ManagementFee::ManagementFee(const Address& self, const Address& fee_manager)
    : self_(self), fee_manager_(fee_manager), ledger_(self) {}

FeeHooks ManagementFee::implemented_hooks() const {
    FeeHooks hooks;
    hooks.settle = {Hook::CONTINUOUS, Hook::PRE_BUY_SHARES, Hook::PRE_REDEEM_SHARES};
    return hooks;
}

// =============================================================================
// Configuration
// =============================================================================

void ManagementFee::add_fund_settings(const Address& caller, const FundId& fund, const FeeSettings& settings) {
    require_caller(caller, fee_manager_, "ManagementFee::add_fund_settings");

    const auto* params = std::get_if<ManagementFeeSettings>(&settings.params);
    if (settings.kind != FeeKind::MANAGEMENT || params == nullptr) {
        throw InvalidSettingsError("management fee expects ManagementFeeSettings");
    }
    if (params->scaled_per_second_rate < RAY || params->scaled_per_second_rate > max_scaled_per_second_rate()) {
        throw RateOutOfRangeError("management fee rate out of range: " + params->scaled_per_second_rate.str());
    }

    ManagementFeeInfo info;
    info.scaled_per_second_rate = params->scaled_per_second_rate;
    info.policy = params->policy;
    ledger_.add_fund_settings(self_, fund, info);

    log::info("ManagementFee: settings added for fund " + addresses::to_hex(fund) +
              " scaled_per_second_rate=" + info.scaled_per_second_rate.str());
}

void ManagementFee::activate_for_fund(const Address& caller, const FundId& fund, const FundView& view) {
    require_caller(caller, fee_manager_, "ManagementFee::activate_for_fund");
    (void)fund;
    (void)view;
}

// =============================================================================
// Settlement
// =============================================================================

SettlementInstruction ManagementFee::settle(const Address& caller, const FundId& fund, const FundView& view,
                                            Hook hook, const HookPayload& payload) {
    require_caller(caller, fee_manager_, "ManagementFee::settle");
    (void)payload;

    ManagementFeeInfo info = ledger_.get(fund);

    // Never settled: start the clock, charge nothing for the time before
    uint64_t seconds_since_settlement = 0;
    if (info.last_settled != 0) {
        if (view.now < info.last_settled) {
            throw NotMonotonicError("settlement at " + std::to_string(view.now) +
                                    " precedes last settlement at " + std::to_string(info.last_settled));
        }
        seconds_since_settlement = view.now - info.last_settled;
    }

    U256 due = shares_due(info.scaled_per_second_rate, view.net_shares_supply(), seconds_since_settlement);

    // lastSettled moves even when nothing accrued
    ledger_.record_settlement(self_, fund, view.now);

    log::debug("ManagementFee: settled fund " + addresses::to_hex(fund) + " on " + to_string(hook) +
               " shares=" + due.str() + " seconds=" + std::to_string(seconds_since_settlement));

    if (due == 0) {
        return SettlementInstruction::none();
    }

    SettlementInstruction instruction;
    instruction.shares_due = due;
    if (info.policy == SettlementPolicy::MINT_SHARES_OUTSTANDING) {
        ledger_.add_shares_outstanding(self_, fund, due);
        instruction.type = SettlementType::MINT_SHARES_OUTSTANDING;
    } else {
        instruction.type = SettlementType::MINT;
    }
    return instruction;
}

void ManagementFee::update(const Address& caller, const FundId& fund, const FundView& view,
                           Hook hook, const HookPayload& payload) {
    require_caller(caller, fee_manager_, "ManagementFee::update");
    (void)fund;
    (void)view;
    (void)hook;
    (void)payload;
}

// =============================================================================
// Payout
// =============================================================================

U256 ManagementFee::payout(const Address& caller, const FundId& fund, uint64_t now) {
    require_caller(caller, fee_manager_, "ManagementFee::payout");
    (void)now;
    return release_outstanding(fund);
}

U256 ManagementFee::force_payout(const Address& caller, const FundId& fund, uint64_t now) {
    require_caller(caller, fee_manager_, "ManagementFee::force_payout");
    (void)now;
    return release_outstanding(fund);
}

U256 ManagementFee::release_outstanding(const FundId& fund) {
    ManagementFeeInfo info = ledger_.get(fund);
    if (info.policy != SettlementPolicy::MINT_SHARES_OUTSTANDING) {
        return 0;
    }
    U256 released = ledger_.take_shares_outstanding(self_, fund);
    if (released > 0) {
        log::debug("ManagementFee: paid out " + released.str() + " shares for fund " + addresses::to_hex(fund));
    }
    return released;
}

// =============================================================================
// Queries
// =============================================================================

FeeLedgerEntry ManagementFee::fee_info(const FundId& fund) const {
    ManagementFeeInfo info = ledger_.get(fund);
    return FeeLedgerEntry{info.scaled_per_second_rate, info.last_settled};
}

std::unique_ptr<FeeCheckpoint> ManagementFee::checkpoint(const Address& caller, const FundId& fund) {
    require_caller(caller, fee_manager_, "ManagementFee::checkpoint");
    return std::make_unique<LedgerCheckpoint<ManagementFeeInfo>>(ledger_, fund);
}

} // namespace enzyme
