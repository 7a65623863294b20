#ifndef ENZYME_VAULT_HPP
#define ENZYME_VAULT_HPP

#include <map>
#include <set>
#include <shared_mutex>
#include <vector>

#include "types.hpp"

namespace enzyme {

// =============================================================================
// ShareVault - the fund's share ledger
// =============================================================================
//
// Holds total supply and per-holder balances. Shares held by the vault's own
// address are fee shares outstanding. Only accessors (the fund controller and
// the fee manager) may mint, burn or move shares.

class ShareVault {
public:
    ShareVault(const Address& self, const Address& owner);
    ~ShareVault() = default;

    // Non-copyable
    ShareVault(const ShareVault&) = delete;
    ShareVault& operator=(const ShareVault&) = delete;

    const Address& address() const { return self_; }
    const Address& owner() const { return owner_; }

    // =========================================================================
    // Access Control
    // =========================================================================

    // Owner only
    void add_accessor(const Address& caller, const Address& accessor);
    void remove_accessor(const Address& caller, const Address& accessor);
    bool is_accessor(const Address& account) const;

    // =========================================================================
    // Share Ledger
    // =========================================================================

    void mint_shares(const Address& caller, const Address& to, const U256& amount);

    // Throws InsufficientSharesError if from holds less than amount
    void burn_shares(const Address& caller, const Address& from, const U256& amount);

    // Throws InsufficientSharesError if from holds less than amount
    void transfer_shares(const Address& caller, const Address& from, const Address& to, const U256& amount);

    U256 total_supply() const;
    U256 balance_of(const Address& account) const;

    // Shares parked in the vault itself
    U256 shares_outstanding() const { return balance_of(self_); }

    // Holders with a non-zero balance, ordered by address
    std::vector<std::pair<Address, U256>> holders() const;

    // =========================================================================
    // Checkpoints
    // =========================================================================

    struct Snapshot {
        std::map<Address, U256> balances;
        U256 total_supply = 0;
    };

    Snapshot snapshot() const;

    // Accessor only
    void restore(const Address& caller, const Snapshot& snap);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_holders;
        uint64_t total_mints;
        uint64_t total_burns;
        uint64_t total_transfers;
        U256 total_supply;
    };
    Stats get_stats() const;

private:
    void require_accessor(const Address& caller, const char* what) const;

    Address self_;
    Address owner_;
    std::set<Address> accessors_;

    // Ordered so reports and snapshots are deterministic
    std::map<Address, U256> balances_;
    U256 total_supply_ = 0;

    uint64_t total_mints_ = 0;
    uint64_t total_burns_ = 0;
    uint64_t total_transfers_ = 0;

    mutable std::shared_mutex mutex_;
};

} // namespace enzyme

#endif // ENZYME_VAULT_HPP
