// =============================================================================
// performance_fee.cpp - PerformanceFee Implementation
// =============================================================================

#include "enzyme/performance_fee.hpp"
#include "enzyme/log.hpp"

#include <algorithm>

namespace enzyme {

namespace {

const U256& require_gav(const FundView& view, const char* what) {
    if (!view.gav) {
        throw GavUnavailableError(std::string(what) + ": GAV required");
    }
    return *view.gav;
}

// Value due after moving from prev_share_price to share_price, only counting
// movement above the high-water mark. Never negative.
U256 calc_aggregate_value_due(const U256& net_shares_supply, const U256& share_price,
                              const U256& prev_share_price, const U256& prev_value_due,
                              const U256& rate, const U256& high_water_mark) {
    const U256 current = std::max(high_water_mark, share_price);
    const U256 previous = std::max(high_water_mark, prev_share_price);

    if (current >= previous) {
        U256 gain = (current - previous) * net_shares_supply / SHARE_UNIT;
        return prev_value_due + gain * rate / WAD;
    }

    U256 loss = (previous - current) * net_shares_supply / SHARE_UNIT;
    U256 reduction = loss * rate / WAD;
    return prev_value_due > reduction ? U256(prev_value_due - reduction) : U256(0);
}

} // namespace

PerformanceFee::PerformanceFee(const Address& self, const Address& fee_manager)
    : self_(self), fee_manager_(fee_manager), ledger_(self) {}

FeeHooks PerformanceFee::implemented_hooks() const {
    FeeHooks hooks;
    hooks.settle = {Hook::CONTINUOUS, Hook::PRE_BUY_SHARES, Hook::PRE_REDEEM_SHARES};
    hooks.update = {Hook::CONTINUOUS, Hook::POST_BUY_SHARES, Hook::PRE_REDEEM_SHARES};
    hooks.uses_gav_on_settle = true;
    hooks.uses_gav_on_update = true;
    return hooks;
}

// =============================================================================
// Configuration
// =============================================================================

void PerformanceFee::add_fund_settings(const Address& caller, const FundId& fund, const FeeSettings& settings) {
    require_caller(caller, fee_manager_, "PerformanceFee::add_fund_settings");

    const auto* params = std::get_if<PerformanceFeeSettings>(&settings.params);
    if (settings.kind != FeeKind::PERFORMANCE || params == nullptr) {
        throw InvalidSettingsError("performance fee expects PerformanceFeeSettings");
    }
    if (params->rate == 0 || params->rate >= WAD) {
        throw RateOutOfRangeError("performance fee rate must be in (0, 1): " + wad::to_string(params->rate));
    }
    if (params->period == 0) {
        throw InvalidSettingsError("performance fee period must be positive");
    }

    PerformanceFeeInfo info;
    info.rate = params->rate;
    info.period = params->period;
    ledger_.add_fund_settings(self_, fund, info);

    log::info("PerformanceFee: settings added for fund " + addresses::to_hex(fund) +
              " rate=" + wad::to_string(info.rate) + " period=" + std::to_string(info.period));
}

void PerformanceFee::activate_for_fund(const Address& caller, const FundId& fund, const FundView& view) {
    require_caller(caller, fee_manager_, "PerformanceFee::activate_for_fund");

    U256 gross_share_price = SHARE_UNIT;
    if (view.shares_supply > 0) {
        const U256& gav = require_gav(view, "PerformanceFee::activate_for_fund");
        if (gav > 0) {
            gross_share_price = gav * SHARE_UNIT / view.shares_supply;
        }
    }

    ledger_.modify(self_, fund, [&](PerformanceFeeInfo& info) {
        info.high_water_mark = gross_share_price;
        info.last_share_price = gross_share_price;
        info.activated = view.now;
    });

    log::debug("PerformanceFee: activated for fund " + addresses::to_hex(fund) +
               " high_water_mark=" + gross_share_price.str());
}

// =============================================================================
// Settlement
// =============================================================================

SettlementInstruction PerformanceFee::settle(const Address& caller, const FundId& fund, const FundView& view,
                                             Hook hook, const HookPayload& payload) {
    require_caller(caller, fee_manager_, "PerformanceFee::settle");
    (void)payload;

    const PerformanceFeeInfo info = ledger_.get(fund);
    const U256& gav = require_gav(view, "PerformanceFee::settle");

    SettlementInstruction instruction;
    if (view.shares_supply > 0) {
        const U256 net_shares_supply = view.net_shares_supply();
        const U256 share_price = net_shares_supply == 0 ? SHARE_UNIT : U256(gav * SHARE_UNIT / net_shares_supply);

        if (share_price != info.last_share_price) {
            const U256 next_value_due = calc_aggregate_value_due(net_shares_supply, share_price,
                                                                 info.last_share_price, info.aggregate_value_due,
                                                                 info.rate, info.high_water_mark);

            if (next_value_due != info.aggregate_value_due && gav > 0) {
                if (next_value_due >= gav) {
                    throw ValueDueExceedsGavError("aggregate value due " + next_value_due.str() +
                                                  " exceeds GAV " + gav.str());
                }

                // Shares that must be outstanding to be worth the value due
                const U256 target_outstanding = next_value_due * net_shares_supply / (gav - next_value_due);
                const U256 outstanding = ledger_.shares_outstanding(fund);

                ledger_.modify(self_, fund, [&](PerformanceFeeInfo& entry) {
                    entry.aggregate_value_due = next_value_due;
                });

                if (target_outstanding > outstanding) {
                    instruction.type = SettlementType::MINT_SHARES_OUTSTANDING;
                    instruction.shares_due = target_outstanding - outstanding;
                    ledger_.add_shares_outstanding(self_, fund, instruction.shares_due);
                } else if (target_outstanding < outstanding) {
                    instruction.type = SettlementType::BURN_SHARES_OUTSTANDING;
                    instruction.shares_due =
                        ledger_.remove_shares_outstanding(self_, fund, outstanding - target_outstanding);
                }
            }
        }
    }

    ledger_.record_settlement(self_, fund, view.now);

    log::debug("PerformanceFee: settled fund " + addresses::to_hex(fund) + " on " + to_string(hook) + " " +
               to_string(instruction.type) + " shares=" + instruction.shares_due.str());
    return instruction;
}

void PerformanceFee::update(const Address& caller, const FundId& fund, const FundView& view,
                            Hook hook, const HookPayload& payload) {
    require_caller(caller, fee_manager_, "PerformanceFee::update");

    const U256 price = next_share_price(view, hook, payload);
    ledger_.modify(self_, fund, [&](PerformanceFeeInfo& info) { info.last_share_price = price; });

    log::debug("PerformanceFee: last share price for fund " + addresses::to_hex(fund) + " now " + price.str());
}

// Share price the fund will have once the hook's operation completes.
// On PRE_REDEEM_SHARES neither the shares nor the assets have left yet.
U256 PerformanceFee::next_share_price(const FundView& view, Hook hook, const HookPayload& payload) const {
    const U256& gav = require_gav(view, "PerformanceFee::update");
    if (gav == 0) return SHARE_UNIT;

    U256 net_shares_supply = view.net_shares_supply();
    if (net_shares_supply == 0) return SHARE_UNIT;

    U256 next_gav = gav;
    if (hook == Hook::PRE_REDEEM_SHARES) {
        if (payload.shares_redeemed >= net_shares_supply) return SHARE_UNIT;
        net_shares_supply -= payload.shares_redeemed;

        const U256 gav_decrease = payload.shares_redeemed * gav / view.shares_supply;
        if (gav_decrease >= next_gav) return SHARE_UNIT;
        next_gav -= gav_decrease;
    }

    return next_gav * SHARE_UNIT / net_shares_supply;
}

// =============================================================================
// Payout
// =============================================================================

bool PerformanceFee::payout_allowed(const FundId& fund, uint64_t now) const {
    const PerformanceFeeInfo info = ledger_.get(fund);
    if (now < info.activated) return false;

    const uint64_t time_since_activated = now - info.activated;
    if (time_since_activated < info.period) return false;

    const uint64_t period_start = now - (time_since_activated % info.period);
    return info.last_paid < period_start;
}

U256 PerformanceFee::payout(const Address& caller, const FundId& fund, uint64_t now) {
    require_caller(caller, fee_manager_, "PerformanceFee::payout");
    if (!payout_allowed(fund, now)) {
        return 0;
    }
    return crystallize(fund, now);
}

U256 PerformanceFee::force_payout(const Address& caller, const FundId& fund, uint64_t now) {
    require_caller(caller, fee_manager_, "PerformanceFee::force_payout");
    return crystallize(fund, now);
}

U256 PerformanceFee::crystallize(const FundId& fund, uint64_t now) {
    U256 high_water_mark = 0;
    ledger_.modify(self_, fund, [&](PerformanceFeeInfo& info) {
        info.last_paid = now;
        info.high_water_mark = std::max(info.high_water_mark, info.last_share_price);
        info.aggregate_value_due = 0;
        high_water_mark = info.high_water_mark;
    });
    U256 released = ledger_.take_shares_outstanding(self_, fund);

    log::info("PerformanceFee: crystallized fund " + addresses::to_hex(fund) + " released=" + released.str() +
              " high_water_mark=" + high_water_mark.str());
    return released;
}

// =============================================================================
// Queries
// =============================================================================

FeeLedgerEntry PerformanceFee::fee_info(const FundId& fund) const {
    PerformanceFeeInfo info = ledger_.get(fund);
    return FeeLedgerEntry{info.rate, info.last_settled};
}

std::unique_ptr<FeeCheckpoint> PerformanceFee::checkpoint(const Address& caller, const FundId& fund) {
    require_caller(caller, fee_manager_, "PerformanceFee::checkpoint");
    return std::make_unique<LedgerCheckpoint<PerformanceFeeInfo>>(ledger_, fund);
}

} // namespace enzyme
