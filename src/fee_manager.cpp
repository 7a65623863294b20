// =============================================================================
// fee_manager.cpp - FeeManager Implementation
// =============================================================================

#include "enzyme/fee_manager.hpp"
#include "enzyme/log.hpp"

#include <algorithm>
#include <cstddef>
#include <unordered_set>

namespace enzyme {

// =============================================================================
// FundCheckpoint
// =============================================================================

FundCheckpoint::~FundCheckpoint() {
    if (!lock_.owns_lock()) return;
    try {
        manager_->abandon_unit(*this);
    } catch (const std::exception& e) {
        log::error("FeeManager: rollback of abandoned unit on fund " + addresses::to_hex(fund_) +
                   " failed: " + e.what());
    }
}

// =============================================================================
// Constructor
// =============================================================================

FeeManager::FeeManager(const Address& self, const ChainClock& clock) : self_(self), clock_(clock) {}

// =============================================================================
// Fee Registry
// =============================================================================

void FeeManager::register_fee(std::unique_ptr<IFee> fee) {
    if (!fee) {
        throw InvalidSettingsError("cannot register a null fee");
    }
    if (fee->fee_manager() != self_) {
        throw InvalidSettingsError(std::string(to_string(fee->kind())) + " fee answers to " +
                                   addresses::to_hex(fee->fee_manager()) + ", not " + addresses::to_hex(self_));
    }

    std::unique_lock lock(fees_mutex_);
    const FeeKind kind = fee->kind();
    if (fees_by_kind_.count(kind) != 0) {
        throw AlreadyConfiguredError(std::string("fee already registered for kind ") + to_string(kind));
    }

    fees_by_kind_[kind] = fee.get();
    fees_.push_back(std::move(fee));

    log::info(std::string("FeeManager: registered ") + to_string(kind) + " fee");
}

IFee* FeeManager::get_fee(FeeKind kind) const {
    std::shared_lock lock(fees_mutex_);
    auto it = fees_by_kind_.find(kind);
    return (it != fees_by_kind_.end()) ? it->second : nullptr;
}

std::vector<FeeKind> FeeManager::registered_fees() const {
    std::shared_lock lock(fees_mutex_);
    std::vector<FeeKind> kinds;
    kinds.reserve(fees_.size());
    for (const auto& fee : fees_) {
        kinds.push_back(fee->kind());
    }
    return kinds;
}

// =============================================================================
// Fund Configuration
// =============================================================================

void FeeManager::configure_fund(const FundId& fund, ShareVault& vault, const Address& fee_recipient,
                                const std::vector<FeeSettings>& settings) {
    if (!vault.is_accessor(self_)) {
        throw UnauthorizedCallerError("fee manager " + addresses::to_hex(self_) + " is not an accessor of vault " +
                                      addresses::to_hex(vault.address()));
    }

    // Resolve kinds to fees, in registration order
    std::vector<std::pair<IFee*, const FeeSettings*>> enabled;
    {
        std::shared_lock lock(fees_mutex_);
        std::unordered_set<uint8_t> seen;
        for (const auto& s : settings) {
            auto it = fees_by_kind_.find(s.kind);
            if (it == fees_by_kind_.end()) {
                throw UnknownFeeKindError(std::string("no fee registered for kind ") + to_string(s.kind));
            }
            if (!seen.insert(static_cast<uint8_t>(s.kind)).second) {
                throw AlreadyConfiguredError(std::string("fee kind listed twice: ") + to_string(s.kind));
            }
        }
        for (const auto& fee : fees_) {
            auto it = std::find_if(settings.begin(), settings.end(),
                                   [&](const FeeSettings& s) { return s.kind == fee->kind(); });
            if (it != settings.end()) {
                enabled.emplace_back(fee.get(), &*it);
            }
        }
    }

    auto record = std::make_unique<FundRecord>();
    record->vault = &vault;
    record->fee_recipient = fee_recipient;
    for (const auto& entry : enabled) {
        record->fees.push_back(entry.first);
    }

    // Activation tolerates a missing GAV; a fee that needs it will say so
    const std::optional<U256> gav = lookup_gav(fund, HookPayload{});

    std::unique_lock lock(funds_mutex_);
    if (funds_.find(fund) != funds_.end()) {
        throw AlreadyConfiguredError("fund already configured: " + addresses::to_hex(fund));
    }

    const FundView view = make_view(*record, gav);

    FundCheckpoint checkpoint = make_checkpoint(*record, fund);
    try {
        for (const auto& [fee, s] : enabled) {
            fee->add_fund_settings(self_, fund, *s);
        }
        for (const auto& entry : enabled) {
            entry.first->activate_for_fund(self_, fund, view);
        }
    } catch (const std::exception& e) {
        log::warn("FeeManager: configuration of fund " + addresses::to_hex(fund) + " rolled back: " + e.what());
        restore(*record, checkpoint);
        throw;
    }

    funds_[fund] = std::move(record);

    log::info("FeeManager: configured fund " + addresses::to_hex(fund) + " with " + std::to_string(enabled.size()) +
              " fee(s), recipient " + addresses::to_hex(fee_recipient));
}

bool FeeManager::is_configured(const FundId& fund) const {
    std::shared_lock lock(funds_mutex_);
    return funds_.find(fund) != funds_.end();
}

FeeManager::FundRecord& FeeManager::find_fund(const FundId& fund) const {
    std::shared_lock lock(funds_mutex_);
    auto it = funds_.find(fund);
    if (it == funds_.end()) {
        throw FundNotInitializedError("fund not configured: " + addresses::to_hex(fund));
    }
    return *it->second;
}

IFee* FeeManager::find_enabled_fee(const FundRecord& record, const FundId& fund, FeeKind kind) const {
    for (IFee* fee : record.fees) {
        if (fee->kind() == kind) return fee;
    }
    if (get_fee(kind) == nullptr) {
        throw UnknownFeeKindError(std::string("no fee registered for kind ") + to_string(kind));
    }
    throw UnknownFeeKindError(std::string(to_string(kind)) + " fee not enabled for fund " + addresses::to_hex(fund));
}

// =============================================================================
// Checkpoints
// =============================================================================

FundCheckpoint FeeManager::make_checkpoint(FundRecord& record, const FundId& fund) {
    FundCheckpoint checkpoint;
    checkpoint.manager_ = this;
    checkpoint.fund_ = fund;
    checkpoint.vault_snapshot_ = record.vault->snapshot();
    checkpoint.fees_.reserve(record.fees.size());
    for (IFee* fee : record.fees) {
        checkpoint.fees_.push_back(fee->checkpoint(self_, fund));
    }
    checkpoint.events_mark_ = record.pending_events.size();
    return checkpoint;
}

void FeeManager::restore(FundRecord& record, FundCheckpoint& checkpoint) {
    // Fees first: their buckets must agree with the vault balance restored below
    for (auto it = checkpoint.fees_.rbegin(); it != checkpoint.fees_.rend(); ++it) {
        (*it)->restore();
    }
    record.vault->restore(self_, checkpoint.vault_snapshot_);

    auto& events = record.pending_events;
    if (events.size() > checkpoint.events_mark_) {
        events.erase(events.begin() + static_cast<std::ptrdiff_t>(checkpoint.events_mark_), events.end());
    }
}

template <typename Fn>
auto FeeManager::atomically(FundRecord& record, const FundId& fund, const char* what, Fn&& fn) -> decltype(fn()) {
    FundCheckpoint checkpoint = make_checkpoint(record, fund);
    try {
        return fn();
    } catch (const std::exception& e) {
        total_rollbacks_.fetch_add(1, std::memory_order_relaxed);
        log::warn(std::string("FeeManager: ") + what + " for fund " + addresses::to_hex(fund) +
                  " rolled back: " + e.what());
        restore(record, checkpoint);
        throw;
    }
}

// =============================================================================
// Units
// =============================================================================

FundCheckpoint FeeManager::begin_unit(const Address& caller, const FundId& fund) {
    require_caller(caller, fund, "FeeManager::begin_unit");
    FundRecord& record = find_fund(fund);

    std::unique_lock<std::recursive_mutex> fund_lock(record.mutex);
    if (record.unit_open) {
        throw AlreadyConfiguredError("fund " + addresses::to_hex(fund) + " already has an open unit");
    }

    FundCheckpoint unit = make_checkpoint(record, fund);
    unit.lock_ = std::move(fund_lock);
    record.unit_open = true;
    return unit;
}

FeeManager::FundRecord& FeeManager::open_unit_record(const Address& caller, FundCheckpoint& unit, const char* what) {
    require_caller(caller, unit.fund_, what);
    if (unit.manager_ != this || !unit.lock_.owns_lock()) {
        throw InvalidSettingsError(std::string(what) + ": unit on fund " + addresses::to_hex(unit.fund_) +
                                   " is not open");
    }
    return find_fund(unit.fund_);
}

void FeeManager::commit_unit(const Address& caller, FundCheckpoint& unit) {
    FundRecord& record = open_unit_record(caller, unit, "FeeManager::commit_unit");

    record.unit_open = false;
    unit.committed_ = take_events(record);
    unit.lock_.unlock();
}

void FeeManager::rollback_unit(const Address& caller, FundCheckpoint& unit) {
    open_unit_record(caller, unit, "FeeManager::rollback_unit");
    abandon_unit(unit);
}

void FeeManager::abandon_unit(FundCheckpoint& unit) {
    FundRecord& record = find_fund(unit.fund_);

    record.unit_open = false;
    restore(record, unit);
    unit.committed_.clear();
    unit.lock_.unlock();

    log::info("FeeManager: unit on fund " + addresses::to_hex(unit.fund_) + " rolled back");
}

void FeeManager::publish(FundCheckpoint& unit) const {
    std::vector<FeeEvent> events;
    events.swap(unit.committed_);
    emit(events);
}

// =============================================================================
// Hooks
// =============================================================================

std::vector<AppliedInstruction> FeeManager::dispatch_hook(const FundId& fund, Hook hook, const HookPayload& payload) {
    FundRecord& record = find_fund(fund);

    std::vector<AppliedInstruction> applied;
    std::vector<FeeEvent> events;
    {
        std::lock_guard fund_lock(record.mutex);
        total_dispatches_.fetch_add(1, std::memory_order_relaxed);
        applied = atomically(record, fund, to_string(hook), [&] { return run_hook(record, fund, hook, payload); });
        events = take_events(record);
    }

    emit(events);
    return applied;
}

std::vector<AppliedInstruction> FeeManager::run_hook(FundRecord& record, const FundId& fund, Hook hook,
                                                     const HookPayload& payload) {
    std::vector<AppliedInstruction> applied;

    // Settle pass: each fee sees the effects of the ones before it
    for (IFee* fee : record.fees) {
        const FeeHooks hooks = fee->implemented_hooks();
        if (!hooks.settles_on(hook)) continue;

        std::optional<U256> gav;
        if (hooks.uses_gav_on_settle) gav = require_gav(fund, payload);

        const FundView view = make_view(record, gav);
        const uint64_t last_settled = fee->fee_info(fund).last_settled;

        const SettlementInstruction instruction = fee->settle(self_, fund, view, hook, payload);
        if (instruction.type == SettlementType::NONE) continue;

        apply(record, instruction);
        applied.push_back(AppliedInstruction{fee->kind(), instruction});
        total_settlements_.fetch_add(1, std::memory_order_relaxed);

        FeeEvent event;
        event.type = FeeEvent::Type::FeeSettled;
        event.fund = fund;
        event.kind = fee->kind();
        event.hook = hook;
        event.settlement = instruction.type;
        event.seconds_since_settlement = last_settled == 0 ? 0 : view.now - last_settled;
        event.payer = instruction.payer;
        event.shares = instruction.shares_due;
        raise(record, event);
    }

    // Update pass
    for (IFee* fee : record.fees) {
        const FeeHooks hooks = fee->implemented_hooks();
        if (!hooks.updates_on(hook)) continue;

        std::optional<U256> gav;
        if (hooks.uses_gav_on_update) gav = require_gav(fund, payload);

        fee->update(self_, fund, make_view(record, gav), hook, payload);
    }

    return applied;
}

void FeeManager::apply(FundRecord& record, const SettlementInstruction& instruction) {
    ShareVault& vault = *record.vault;
    switch (instruction.type) {
        case SettlementType::DIRECT:
            vault.transfer_shares(self_, instruction.payer, record.fee_recipient, instruction.shares_due);
            break;
        case SettlementType::MINT:
            vault.mint_shares(self_, record.fee_recipient, instruction.shares_due);
            break;
        case SettlementType::BURN:
            vault.burn_shares(self_, instruction.payer, instruction.shares_due);
            break;
        case SettlementType::MINT_SHARES_OUTSTANDING:
            vault.mint_shares(self_, vault.address(), instruction.shares_due);
            break;
        case SettlementType::BURN_SHARES_OUTSTANDING:
            vault.burn_shares(self_, vault.address(), instruction.shares_due);
            break;
        case SettlementType::NONE:
            break;
    }
}

std::vector<FeeKind> FeeManager::payout_outstanding(const FundId& fund, const std::vector<FeeKind>& kinds) {
    FundRecord& record = find_fund(fund);

    std::vector<FeeKind> paid;
    std::vector<FeeEvent> events;
    {
        std::lock_guard fund_lock(record.mutex);

        // Reject unknown kinds before anything moves
        std::vector<IFee*> fees;
        fees.reserve(kinds.size());
        for (FeeKind kind : kinds) {
            fees.push_back(find_enabled_fee(record, fund, kind));
        }

        paid = atomically(record, fund, "payout", [&] {
            std::vector<FeeKind> released;
            const uint64_t now = clock_.now();
            for (IFee* fee : fees) {
                if (transfer_payout(record, fund, fee, fee->payout(self_, fund, now)) > 0) {
                    released.push_back(fee->kind());
                }
            }
            return released;
        });
        events = take_events(record);
    }

    emit(events);
    return paid;
}

void FeeManager::prepare_for_migration(const FundId& fund, const HookPayload& payload) {
    FundRecord& record = find_fund(fund);

    std::vector<FeeEvent> events;
    {
        std::lock_guard fund_lock(record.mutex);
        total_dispatches_.fetch_add(1, std::memory_order_relaxed);
        atomically(record, fund, "migration", [&] {
            run_hook(record, fund, Hook::CONTINUOUS, payload);
            const uint64_t now = clock_.now();
            for (IFee* fee : record.fees) {
                transfer_payout(record, fund, fee, fee->force_payout(self_, fund, now));
            }
        });
        events = take_events(record);
    }

    emit(events);
    log::info("FeeManager: fund " + addresses::to_hex(fund) + " settled and paid out for migration");
}

U256 FeeManager::transfer_payout(FundRecord& record, const FundId& fund, IFee* fee, U256 released) {
    if (released == 0) return released;

    ShareVault& vault = *record.vault;
    vault.transfer_shares(self_, vault.address(), record.fee_recipient, released);
    total_payouts_.fetch_add(1, std::memory_order_relaxed);

    FeeEvent event;
    event.type = FeeEvent::Type::SharesOutstandingPaidOut;
    event.fund = fund;
    event.kind = fee->kind();
    event.payer = vault.address();
    event.shares = released;
    raise(record, event);
    return released;
}

// =============================================================================
// Fund View and GAV
// =============================================================================

FundView FeeManager::make_view(const FundRecord& record, const std::optional<U256>& gav) const {
    FundView view;
    view.shares_supply = record.vault->total_supply();
    view.shares_outstanding = record.vault->shares_outstanding();
    view.gav = gav;
    view.now = clock_.now();
    return view;
}

std::optional<U256> FeeManager::lookup_gav(const FundId& fund, const HookPayload& payload) const {
    if (payload.gav) return payload.gav;

    GavCallback callback;
    {
        std::shared_lock lock(callbacks_mutex_);
        callback = gav_callback_;
    }
    if (!callback) return std::nullopt;
    return callback(fund);
}

U256 FeeManager::require_gav(const FundId& fund, const HookPayload& payload) const {
    std::optional<U256> gav = lookup_gav(fund, payload);
    if (!gav) {
        throw GavUnavailableError("no gross asset value available for fund " + addresses::to_hex(fund));
    }
    return *gav;
}

// =============================================================================
// Queries
// =============================================================================

FeeLedgerEntry FeeManager::get_fee_info_for_fund(const FundId& fund, FeeKind kind) const {
    const FundRecord& record = find_fund(fund);
    return find_enabled_fee(record, fund, kind)->fee_info(fund);
}

U256 FeeManager::get_shares_outstanding(const FundId& fund, FeeKind kind) const {
    const FundRecord& record = find_fund(fund);
    return find_enabled_fee(record, fund, kind)->shares_outstanding(fund);
}

std::vector<FeeKind> FeeManager::enabled_fees(const FundId& fund) const {
    const FundRecord& record = find_fund(fund);
    std::vector<FeeKind> kinds;
    kinds.reserve(record.fees.size());
    for (IFee* fee : record.fees) {
        kinds.push_back(fee->kind());
    }
    return kinds;
}

Address FeeManager::fee_recipient(const FundId& fund) const {
    return find_fund(fund).fee_recipient;
}

// =============================================================================
// Callbacks
// =============================================================================

void FeeManager::set_gav_callback(GavCallback callback) {
    std::unique_lock lock(callbacks_mutex_);
    gav_callback_ = std::move(callback);
}

void FeeManager::set_event_callback(EventCallback callback) {
    std::unique_lock lock(callbacks_mutex_);
    event_callback_ = std::move(callback);
}

void FeeManager::raise(FundRecord& record, const FeeEvent& event) {
    record.pending_events.push_back(event);
}

std::vector<FeeEvent> FeeManager::take_events(FundRecord& record) {
    std::vector<FeeEvent> events;
    if (!record.unit_open) {
        events.swap(record.pending_events);
    }
    return events;
}

void FeeManager::emit(const std::vector<FeeEvent>& events) const {
    if (events.empty()) return;

    EventCallback callback;
    {
        std::shared_lock lock(callbacks_mutex_);
        callback = event_callback_;
    }

    for (const FeeEvent& event : events) {
        if (event.type == FeeEvent::Type::FeeSettled) {
            log::debug(std::string("FeeManager: FeeSettled fund=") + addresses::to_hex(event.fund) +
                       " kind=" + to_string(event.kind) + " hook=" + to_string(event.hook) +
                       " type=" + to_string(event.settlement) + " shares=" + event.shares.str() +
                       " seconds=" + std::to_string(event.seconds_since_settlement));
        } else {
            log::debug(std::string("FeeManager: SharesOutstandingPaidOut fund=") + addresses::to_hex(event.fund) +
                       " kind=" + to_string(event.kind) + " shares=" + event.shares.str());
        }
        if (callback) callback(event);
    }
}

// =============================================================================
// Statistics
// =============================================================================

FeeManager::Stats FeeManager::get_stats() const {
    Stats stats{};
    {
        std::shared_lock lock(funds_mutex_);
        stats.total_funds = funds_.size();
    }
    stats.total_dispatches = total_dispatches_.load(std::memory_order_relaxed);
    stats.total_settlements = total_settlements_.load(std::memory_order_relaxed);
    stats.total_payouts = total_payouts_.load(std::memory_order_relaxed);
    stats.total_rollbacks = total_rollbacks_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace enzyme
