#ifndef ENZYME_FEE_MANAGER_HPP
#define ENZYME_FEE_MANAGER_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "clock.hpp"
#include "fee.hpp"
#include "vault.hpp"

namespace enzyme {

// =============================================================================
// Fee Events
// =============================================================================

struct FeeEvent {
    enum class Type { FeeSettled, SharesOutstandingPaidOut };

    Type type = Type::FeeSettled;
    FundId fund{};
    FeeKind kind = FeeKind::MANAGEMENT;
    Hook hook = Hook::CONTINUOUS;                      // FeeSettled only
    SettlementType settlement = SettlementType::NONE;  // FeeSettled only
    uint64_t seconds_since_settlement = 0;             // FeeSettled only; 0 on a first settlement
    Address payer{};
    U256 shares = 0;
};

using EventCallback = std::function<void(const FeeEvent&)>;

// Gross asset value lookup; nullopt when the price source cannot answer
using GavCallback = std::function<std::optional<U256>(const FundId&)>;

class FeeManager;

// =============================================================================
// FundCheckpoint - vault + per-fee state of one fund
// =============================================================================
//
// Taken by the fee manager before every dispatch, payout and migration, and
// restored if the operation fails. A checkpoint returned by begin_unit also
// holds the fund's lock until the unit is committed or rolled back; an open
// unit that is destroyed is rolled back.

class FundCheckpoint {
public:
    FundCheckpoint(FundCheckpoint&&) = default;
    FundCheckpoint& operator=(FundCheckpoint&&) = delete;
    ~FundCheckpoint();

    const FundId& fund() const { return fund_; }
    bool is_open() const { return lock_.owns_lock(); }

private:
    friend class FeeManager;
    FundCheckpoint() = default;

    FeeManager* manager_ = nullptr;
    FundId fund_{};
    ShareVault::Snapshot vault_snapshot_;
    std::vector<std::unique_ptr<FeeCheckpoint>> fees_;
    size_t events_mark_ = 0;
    std::vector<FeeEvent> committed_;
    std::unique_lock<std::recursive_mutex> lock_;
};

// =============================================================================
// FeeManager - hook dispatcher and settlement applier
// =============================================================================
//
// Owns the registered fees (one per kind). For every hook it runs the settle
// pass in registration order, applying each instruction to the fund's vault
// before the next fee sees the fund, then the update pass. Each dispatch,
// payout and migration either completes or leaves the vault and every fee
// ledger exactly as it found them.

class FeeManager {
public:
    FeeManager(const Address& self, const ChainClock& clock);
    ~FeeManager() = default;

    // Non-copyable
    FeeManager(const FeeManager&) = delete;
    FeeManager& operator=(const FeeManager&) = delete;

    const Address& address() const { return self_; }

    // =========================================================================
    // Fee Registry
    // =========================================================================

    // Throws AlreadyConfiguredError for a second fee of the same kind and
    // InvalidSettingsError if the fee answers to another manager
    void register_fee(std::unique_ptr<IFee> fee);

    // nullptr if no fee of that kind is registered
    IFee* get_fee(FeeKind kind) const;
    std::vector<FeeKind> registered_fees() const;

    // =========================================================================
    // Fund Configuration
    // =========================================================================

    // One-time per fund. The fee manager must already be a vault accessor.
    void configure_fund(const FundId& fund, ShareVault& vault, const Address& fee_recipient,
                        const std::vector<FeeSettings>& settings);

    bool is_configured(const FundId& fund) const;

    // =========================================================================
    // Hooks
    // =========================================================================

    std::vector<AppliedInstruction> dispatch_hook(const FundId& fund, Hook hook, const HookPayload& payload = {});

    // Returns the kinds that actually transferred shares
    std::vector<FeeKind> payout_outstanding(const FundId& fund, const std::vector<FeeKind>& kinds);

    // CONTINUOUS settlement, then every bucket paid out regardless of period
    void prepare_for_migration(const FundId& fund, const HookPayload& payload = {});

    // =========================================================================
    // Units
    // =========================================================================
    //
    // A unit groups several operations on one fund so they commit or roll
    // back together. Only the fund itself opens and closes its units. While a
    // unit is open other threads wait on the fund, and its events are held
    // back until the unit is committed and published.

    // Throws AlreadyConfiguredError if the fund already has an open unit
    FundCheckpoint begin_unit(const Address& caller, const FundId& fund);

    void commit_unit(const Address& caller, FundCheckpoint& unit);

    // Puts the vault and every fee ledger back to where the unit began
    void rollback_unit(const Address& caller, FundCheckpoint& unit);

    // Delivers a committed unit's events. Call once nothing the event
    // callback may need is locked.
    void publish(FundCheckpoint& unit) const;

    // =========================================================================
    // Queries
    // =========================================================================

    FeeLedgerEntry get_fee_info_for_fund(const FundId& fund, FeeKind kind) const;
    U256 get_shares_outstanding(const FundId& fund, FeeKind kind) const;
    std::vector<FeeKind> enabled_fees(const FundId& fund) const;
    Address fee_recipient(const FundId& fund) const;

    // =========================================================================
    // Callbacks
    // =========================================================================

    void set_gav_callback(GavCallback callback);
    void set_event_callback(EventCallback callback);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_funds;
        uint64_t total_dispatches;
        uint64_t total_settlements;
        uint64_t total_payouts;
        uint64_t total_rollbacks;
    };
    Stats get_stats() const;

private:
    friend class FundCheckpoint;

    struct FundRecord {
        ShareVault* vault = nullptr;
        Address fee_recipient{};
        std::vector<IFee*> fees;  // registration order

        // Recursive so that operations inside an open unit can relock
        std::recursive_mutex mutex;
        bool unit_open = false;
        std::vector<FeeEvent> pending_events;
    };

    FundRecord& find_fund(const FundId& fund) const;
    IFee* find_enabled_fee(const FundRecord& record, const FundId& fund, FeeKind kind) const;

    FundCheckpoint make_checkpoint(FundRecord& record, const FundId& fund);
    void restore(FundRecord& record, FundCheckpoint& checkpoint);

    FundRecord& open_unit_record(const Address& caller, FundCheckpoint& unit, const char* what);
    void abandon_unit(FundCheckpoint& unit);

    // Runs fn, restoring the checkpoint and rethrowing on any failure
    template <typename Fn>
    auto atomically(FundRecord& record, const FundId& fund, const char* what, Fn&& fn) -> decltype(fn());

    std::vector<AppliedInstruction> run_hook(FundRecord& record, const FundId& fund, Hook hook,
                                             const HookPayload& payload);
    void apply(FundRecord& record, const SettlementInstruction& instruction);
    U256 transfer_payout(FundRecord& record, const FundId& fund, IFee* fee, U256 released);

    FundView make_view(const FundRecord& record, const std::optional<U256>& gav) const;
    std::optional<U256> lookup_gav(const FundId& fund, const HookPayload& payload) const;
    U256 require_gav(const FundId& fund, const HookPayload& payload) const;

    // Events wait in the record until their operation, or the open unit, succeeds
    void raise(FundRecord& record, const FeeEvent& event);
    std::vector<FeeEvent> take_events(FundRecord& record);
    void emit(const std::vector<FeeEvent>& events) const;

    Address self_;
    const ChainClock& clock_;

    // Registered fees in registration order
    std::vector<std::unique_ptr<IFee>> fees_;
    std::unordered_map<FeeKind, IFee*> fees_by_kind_;
    mutable std::shared_mutex fees_mutex_;

    std::unordered_map<FundId, std::unique_ptr<FundRecord>, addresses::Hash> funds_;
    mutable std::shared_mutex funds_mutex_;

    GavCallback gav_callback_;
    EventCallback event_callback_;
    mutable std::shared_mutex callbacks_mutex_;

    // Statistics
    std::atomic<uint64_t> total_dispatches_{0};
    std::atomic<uint64_t> total_settlements_{0};
    std::atomic<uint64_t> total_payouts_{0};
    std::atomic<uint64_t> total_rollbacks_{0};
};

} // namespace enzyme

#endif // ENZYME_FEE_MANAGER_HPP
