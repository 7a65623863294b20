// =============================================================================
// entrance_rate_fee.cpp - EntranceRateFee Implementation
// =============================================================================

#include "enzyme/entrance_rate_fee.hpp"
#include "enzyme/log.hpp"

namespace enzyme {

EntranceRateFee::EntranceRateFee(FeeKind kind, const Address& self, const Address& fee_manager)
    : kind_(kind), self_(self), fee_manager_(fee_manager), ledger_(self) {
    if (kind == FeeKind::ENTRANCE_RATE_BURN) {
        settlement_type_ = SettlementType::BURN;
    } else if (kind == FeeKind::ENTRANCE_RATE_DIRECT) {
        settlement_type_ = SettlementType::DIRECT;
    } else {
        throw InvalidSettingsError(std::string("not an entrance rate fee kind: ") + to_string(kind));
    }
}

FeeHooks EntranceRateFee::implemented_hooks() const {
    FeeHooks hooks;
    hooks.settle = {Hook::POST_BUY_SHARES};
    return hooks;
}

void EntranceRateFee::add_fund_settings(const Address& caller, const FundId& fund, const FeeSettings& settings) {
    require_caller(caller, fee_manager_, "EntranceRateFee::add_fund_settings");

    const auto* params = std::get_if<EntranceRateFeeSettings>(&settings.params);
    if (settings.kind != kind_ || params == nullptr) {
        throw InvalidSettingsError(std::string(to_string(kind_)) + " expects EntranceRateFeeSettings");
    }
    if (params->rate == 0 || params->rate >= WAD) {
        throw RateOutOfRangeError("entrance fee rate must be in (0, 1): " + wad::to_string(params->rate));
    }

    ledger_.add_fund_settings(self_, fund, EntranceRateFeeInfo{params->rate, 0});

    log::info(std::string(to_string(kind_)) + ": settings added for fund " + addresses::to_hex(fund) +
              " rate=" + wad::to_string(params->rate));
}

void EntranceRateFee::activate_for_fund(const Address& caller, const FundId& fund, const FundView& view) {
    require_caller(caller, fee_manager_, "EntranceRateFee::activate_for_fund");
    (void)fund;
    (void)view;
}

SettlementInstruction EntranceRateFee::settle(const Address& caller, const FundId& fund, const FundView& view,
                                              Hook hook, const HookPayload& payload) {
    require_caller(caller, fee_manager_, "EntranceRateFee::settle");
    (void)hook;

    const EntranceRateFeeInfo info = ledger_.get(fund);
    const U256 due = payload.shares_bought * info.rate / WAD;

    ledger_.record_settlement(self_, fund, view.now);

    if (due == 0) {
        return SettlementInstruction::none();
    }

    SettlementInstruction instruction;
    instruction.type = settlement_type_;
    instruction.payer = payload.investor;
    instruction.shares_due = due;

    log::debug(std::string(to_string(kind_)) + ": settled fund " + addresses::to_hex(fund) +
               " payer=" + addresses::to_hex(payload.investor) + " shares=" + due.str());
    return instruction;
}

void EntranceRateFee::update(const Address& caller, const FundId& fund, const FundView& view,
                             Hook hook, const HookPayload& payload) {
    require_caller(caller, fee_manager_, "EntranceRateFee::update");
    (void)fund;
    (void)view;
    (void)hook;
    (void)payload;
}

U256 EntranceRateFee::payout(const Address& caller, const FundId& fund, uint64_t now) {
    require_caller(caller, fee_manager_, "EntranceRateFee::payout");
    (void)fund;
    (void)now;
    return 0;
}

U256 EntranceRateFee::force_payout(const Address& caller, const FundId& fund, uint64_t now) {
    require_caller(caller, fee_manager_, "EntranceRateFee::force_payout");
    (void)fund;
    (void)now;
    return 0;
}

FeeLedgerEntry EntranceRateFee::fee_info(const FundId& fund) const {
    EntranceRateFeeInfo info = ledger_.get(fund);
    return FeeLedgerEntry{info.rate, info.last_settled};
}

std::unique_ptr<FeeCheckpoint> EntranceRateFee::checkpoint(const Address& caller, const FundId& fund) {
    require_caller(caller, fee_manager_, "EntranceRateFee::checkpoint");
    return std::make_unique<LedgerCheckpoint<EntranceRateFeeInfo>>(ledger_, fund);
}

} // namespace enzyme
