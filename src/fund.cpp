// =============================================================================
// fund.cpp - Fund Implementation
// =============================================================================

#include "enzyme/fund.hpp"
#include "enzyme/log.hpp"

namespace enzyme {

Fund::Fund(const FundId& id, const Address& owner, FeeManager& fee_manager, ShareVault& vault, ChainClock& clock)
    : id_(id), owner_(owner), fee_manager_(fee_manager), vault_(vault), clock_(clock) {
    if (!vault_.is_accessor(id_)) {
        throw UnauthorizedCallerError("fund " + addresses::to_hex(id_) + " is not an accessor of vault " +
                                      addresses::to_hex(vault_.address()));
    }
}

template <typename Fn>
auto Fund::atomically(const char* what, Fn&& fn) -> decltype(fn()) {
    std::unique_lock lock(mutex_);
    FundCheckpoint unit = fee_manager_.begin_unit(id_, id_);
    const U256 saved_holdings = holdings_;

    std::optional<decltype(fn())> result;
    try {
        result.emplace(fn());
        fee_manager_.commit_unit(id_, unit);
    } catch (const std::exception& e) {
        log::warn(std::string("Fund: ") + what + " on " + addresses::to_hex(id_) + " rolled back: " + e.what());
        fee_manager_.rollback_unit(id_, unit);
        holdings_ = saved_holdings;
        throw;
    }

    // Observers may call back into the fund
    lock.unlock();
    fee_manager_.publish(unit);
    return std::move(*result);
}

// =============================================================================
// Share Operations
// =============================================================================

U256 Fund::buy_shares(const Address& investor, const U256& amount, const U256& min_shares) {
    return atomically("buy_shares", [&] {
        HookPayload pre = make_payload(investor);
        pre.investment_amount = amount;
        fee_manager_.dispatch_hook(id_, Hook::PRE_BUY_SHARES, pre);

        const U256 shares_bought = amount * SHARE_UNIT / current_share_value();
        if (shares_bought == 0 || shares_bought < min_shares) {
            throw InvalidSettingsError("buy of " + amount.str() + " yields " + shares_bought.str() +
                                       " shares, below minimum " + min_shares.str());
        }

        const U256 balance_before = vault_.balance_of(investor);
        holdings_ += amount;
        vault_.mint_shares(id_, investor, shares_bought);

        HookPayload post = make_payload(investor);
        post.investment_amount = amount;
        post.shares_bought = shares_bought;
        fee_manager_.dispatch_hook(id_, Hook::POST_BUY_SHARES, post);

        const U256 received = vault_.balance_of(investor) - balance_before;
        log::info("Fund: " + addresses::to_hex(investor) + " bought " + received.str() + " shares for " +
                  amount.str() + " at t=" + std::to_string(clock_.now()));
        return received;
    });
}

U256 Fund::redeem_shares(const Address& investor, const U256& quantity) {
    return atomically("redeem_shares", [&] {
        if (quantity == 0 || vault_.balance_of(investor) < quantity) {
            throw InsufficientSharesError(addresses::to_hex(investor) + " cannot redeem " + quantity.str() +
                                          " shares");
        }

        HookPayload pre = make_payload(investor);
        pre.shares_redeemed = quantity;
        fee_manager_.dispatch_hook(id_, Hook::PRE_REDEEM_SHARES, pre);

        // Fee settlement may have diluted the supply
        const U256 supply = vault_.total_supply();
        const std::optional<U256> gav = current_gav();
        if (!gav) {
            throw GavUnavailableError("no gross asset value for fund " + addresses::to_hex(id_));
        }

        const U256 payout = quantity * *gav / supply;
        if (payout > holdings_) {
            throw InsufficientSharesError("fund holdings " + holdings_.str() + " cannot cover " + payout.str());
        }

        vault_.burn_shares(id_, investor, quantity);
        holdings_ -= payout;

        log::info("Fund: " + addresses::to_hex(investor) + " redeemed " + quantity.str() + " shares for " +
                  payout.str() + " at t=" + std::to_string(clock_.now()));
        return payout;
    });
}

std::vector<AppliedInstruction> Fund::invoke_continuous_hook() {
    return atomically("continuous", [&] {
        return fee_manager_.dispatch_hook(id_, Hook::CONTINUOUS, make_payload(Address{}));
    });
}

std::vector<FeeKind> Fund::payout_outstanding(const std::vector<FeeKind>& kinds) {
    return atomically("payout_outstanding", [&] {
        fee_manager_.dispatch_hook(id_, Hook::CONTINUOUS, make_payload(Address{}));
        return fee_manager_.payout_outstanding(id_, kinds);
    });
}

void Fund::migrate(const Address& caller) {
    require_caller(caller, owner_, "Fund::migrate");

    const uint64_t count = atomically("migrate", [&] {
        fee_manager_.prepare_for_migration(id_, make_payload(Address{}));
        return ++migrations_;
    });

    log::info("Fund: " + addresses::to_hex(id_) + " migrated at t=" + std::to_string(clock_.now()) + " (migration " +
              std::to_string(count) + ")");
}

// =============================================================================
// Valuation
// =============================================================================

HookPayload Fund::make_payload(const Address& investor) const {
    HookPayload payload;
    payload.investor = investor;
    payload.gav = current_gav();
    return payload;
}

std::optional<U256> Fund::current_gav() const {
    if (gav_source_) return gav_source_(id_);
    return holdings_;
}

U256 Fund::current_share_value() const {
    const U256 supply = vault_.total_supply();
    if (supply == 0) return SHARE_UNIT;

    const std::optional<U256> gav = current_gav();
    if (!gav) {
        throw GavUnavailableError("no gross asset value for fund " + addresses::to_hex(id_));
    }
    if (*gav == 0) return SHARE_UNIT;
    return *gav * SHARE_UNIT / supply;
}

std::optional<U256> Fund::gross_asset_value() const {
    std::lock_guard lock(mutex_);
    return current_gav();
}

U256 Fund::gross_share_value() const {
    std::lock_guard lock(mutex_);
    return current_share_value();
}

U256 Fund::holdings() const {
    std::lock_guard lock(mutex_);
    return holdings_;
}

void Fund::set_gav_source(GavCallback source) {
    std::lock_guard lock(mutex_);
    gav_source_ = std::move(source);
}

uint64_t Fund::migrations() const {
    std::lock_guard lock(mutex_);
    return migrations_;
}

} // namespace enzyme
