// =============================================================================
// vault.cpp - ShareVault Implementation
// =============================================================================

#include "enzyme/vault.hpp"
#include "enzyme/errors.hpp"

#include <mutex>

namespace enzyme {

namespace {

U256 add_checked(const U256& a, const U256& b) {
    try {
        return a + b;
    } catch (const std::overflow_error& e) {
        throw ArithmeticOverflowError(std::string("share balance: ") + e.what());
    }
}

} // namespace

// =============================================================================
// Constructor
// =============================================================================

ShareVault::ShareVault(const Address& self, const Address& owner) : self_(self), owner_(owner) {}

// =============================================================================
// Access Control
// =============================================================================

void ShareVault::add_accessor(const Address& caller, const Address& accessor) {
    require_caller(caller, owner_, "ShareVault::add_accessor");
    std::unique_lock lock(mutex_);
    accessors_.insert(accessor);
}

void ShareVault::remove_accessor(const Address& caller, const Address& accessor) {
    require_caller(caller, owner_, "ShareVault::remove_accessor");
    std::unique_lock lock(mutex_);
    accessors_.erase(accessor);
}

bool ShareVault::is_accessor(const Address& account) const {
    std::shared_lock lock(mutex_);
    return accessors_.count(account) != 0;
}

void ShareVault::require_accessor(const Address& caller, const char* what) const {
    if (accessors_.count(caller) == 0) {
        throw UnauthorizedCallerError(std::string(what) + ": " + addresses::to_hex(caller) +
                                      " is not a vault accessor");
    }
}

// =============================================================================
// Share Ledger
// =============================================================================

void ShareVault::mint_shares(const Address& caller, const Address& to, const U256& amount) {
    std::unique_lock lock(mutex_);
    require_accessor(caller, "ShareVault::mint_shares");
    if (amount == 0) return;

    U256 next_supply = add_checked(total_supply_, amount);
    U256 next_balance = add_checked(balances_[to], amount);
    total_supply_ = next_supply;
    balances_[to] = next_balance;
    ++total_mints_;
}

void ShareVault::burn_shares(const Address& caller, const Address& from, const U256& amount) {
    std::unique_lock lock(mutex_);
    require_accessor(caller, "ShareVault::burn_shares");
    if (amount == 0) return;

    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        throw InsufficientSharesError("cannot burn " + amount.str() + " shares from " + addresses::to_hex(from));
    }

    it->second -= amount;
    if (it->second == 0) balances_.erase(it);
    total_supply_ -= amount;
    ++total_burns_;
}

void ShareVault::transfer_shares(const Address& caller, const Address& from, const Address& to, const U256& amount) {
    std::unique_lock lock(mutex_);
    require_accessor(caller, "ShareVault::transfer_shares");
    if (amount == 0 || from == to) return;

    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        throw InsufficientSharesError("cannot transfer " + amount.str() + " shares from " + addresses::to_hex(from));
    }

    U256 next_to_balance = add_checked(balances_[to], amount);
    it = balances_.find(from);
    it->second -= amount;
    if (it->second == 0) balances_.erase(it);
    balances_[to] = next_to_balance;
    ++total_transfers_;
}

U256 ShareVault::total_supply() const {
    std::shared_lock lock(mutex_);
    return total_supply_;
}

U256 ShareVault::balance_of(const Address& account) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find(account);
    return (it != balances_.end()) ? it->second : U256(0);
}

std::vector<std::pair<Address, U256>> ShareVault::holders() const {
    std::shared_lock lock(mutex_);
    std::vector<std::pair<Address, U256>> result;
    result.reserve(balances_.size());
    for (const auto& [account, balance] : balances_) {
        if (balance > 0) result.emplace_back(account, balance);
    }
    return result;
}

// =============================================================================
// Checkpoints
// =============================================================================

ShareVault::Snapshot ShareVault::snapshot() const {
    std::shared_lock lock(mutex_);
    return Snapshot{balances_, total_supply_};
}

void ShareVault::restore(const Address& caller, const Snapshot& snap) {
    std::unique_lock lock(mutex_);
    require_accessor(caller, "ShareVault::restore");
    balances_ = snap.balances;
    total_supply_ = snap.total_supply;
}

// =============================================================================
// Statistics
// =============================================================================

ShareVault::Stats ShareVault::get_stats() const {
    std::shared_lock lock(mutex_);
    Stats stats{};
    stats.total_holders = balances_.size();
    stats.total_mints = total_mints_;
    stats.total_burns = total_burns_;
    stats.total_transfers = total_transfers_;
    stats.total_supply = total_supply_;
    return stats;
}

} // namespace enzyme
