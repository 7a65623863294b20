#ifndef ENZYME_FUND_HPP
#define ENZYME_FUND_HPP

#include <mutex>
#include <optional>
#include <vector>

#include "clock.hpp"
#include "fee_manager.hpp"
#include "vault.hpp"

namespace enzyme {

// =============================================================================
// Fund - share lifecycle controller
// =============================================================================
//
// Holds the fund's denomination asset and drives the fee hooks around every
// share movement. GAV is the asset holdings unless a GAV source is set.
// Each operation is all-or-nothing across the vault, the fee ledgers and the
// holdings. The fund's id must be a vault accessor.

class Fund {
public:
    Fund(const FundId& id, const Address& owner, FeeManager& fee_manager, ShareVault& vault, ChainClock& clock);

    // Non-copyable
    Fund(const Fund&) = delete;
    Fund& operator=(const Fund&) = delete;

    const FundId& id() const { return id_; }
    const Address& owner() const { return owner_; }

    // Returns shares received net of entrance fees. Throws InvalidSettingsError
    // when fewer than min_shares would be bought.
    U256 buy_shares(const Address& investor, const U256& amount, const U256& min_shares = 0);

    // Returns the denomination asset paid out
    U256 redeem_shares(const Address& investor, const U256& quantity);

    std::vector<AppliedInstruction> invoke_continuous_hook();

    // Settles, then pays out the given fees' shares outstanding
    std::vector<FeeKind> payout_outstanding(const std::vector<FeeKind>& kinds);

    // Owner only. Settles and forces every payout; the fund stays usable.
    void migrate(const Address& caller);

    // =========================================================================
    // Valuation
    // =========================================================================

    // nullopt when the GAV source cannot answer
    std::optional<U256> gross_asset_value() const;

    // Asset per share unit; SHARE_UNIT for an empty fund
    U256 gross_share_value() const;

    U256 holdings() const;

    // Replaces holdings as the GAV; pass an empty callback to go back
    void set_gav_source(GavCallback source);

    uint64_t migrations() const;

private:
    HookPayload make_payload(const Address& investor) const;
    std::optional<U256> current_gav() const;
    U256 current_share_value() const;

    // Runs fn under the fund lock as one fee manager unit, rolling back vault,
    // fees and holdings on failure. Events are published after the lock is
    // released.
    template <typename Fn>
    auto atomically(const char* what, Fn&& fn) -> decltype(fn());

    FundId id_;
    Address owner_;
    FeeManager& fee_manager_;
    ShareVault& vault_;
    ChainClock& clock_;

    U256 holdings_ = 0;
    GavCallback gav_source_;
    uint64_t migrations_ = 0;

    mutable std::mutex mutex_;
};

} // namespace enzyme

#endif // ENZYME_FUND_HPP
