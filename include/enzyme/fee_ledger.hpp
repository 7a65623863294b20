#ifndef ENZYME_FEE_LEDGER_HPP
#define ENZYME_FEE_LEDGER_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "errors.hpp"
#include "types.hpp"

namespace enzyme {

// =============================================================================
// Fee Checkpoint (transactional rollback)
// =============================================================================

class FeeCheckpoint {
public:
    virtual ~FeeCheckpoint() = default;

    // Put the captured per-fund state back
    virtual void restore() = 0;
};

// =============================================================================
// FeeLedger - per-fund settings, settlement time and shares outstanding
// =============================================================================
//
// One ledger per fee. Only the owning fee (the owner address) may mutate it;
// any other caller gets UnauthorizedCallerError and state is left untouched.
// Entry must expose a `uint64_t last_settled` member.

template <typename Entry>
class FeeLedger {
public:
    struct Record {
        Entry entry{};
        U256 shares_outstanding = 0;
    };

    struct Snapshot {
        FundId fund{};
        std::optional<Record> record;
    };

    explicit FeeLedger(const Address& owner) : owner_(owner) {}

    // Non-copyable
    FeeLedger(const FeeLedger&) = delete;
    FeeLedger& operator=(const FeeLedger&) = delete;

    const Address& owner() const { return owner_; }

    // =========================================================================
    // Configuration
    // =========================================================================

    // One-time; throws AlreadyConfiguredError on a second call
    void add_fund_settings(const Address& caller, const FundId& fund, const Entry& entry) {
        require_caller(caller, owner_, "FeeLedger::add_fund_settings");
        std::unique_lock lock(mutex_);
        if (records_.find(fund) != records_.end()) {
            throw AlreadyConfiguredError("fee settings already added for fund " + addresses::to_hex(fund));
        }
        records_[fund] = Record{entry, 0};
    }

    bool has_fund(const FundId& fund) const {
        std::shared_lock lock(mutex_);
        return records_.find(fund) != records_.end();
    }

    Entry get(const FundId& fund) const {
        std::shared_lock lock(mutex_);
        return find(fund).entry;
    }

    // =========================================================================
    // Settlement bookkeeping
    // =========================================================================

    // Throws NotMonotonicError if timestamp < last_settled (unless never settled)
    void record_settlement(const Address& caller, const FundId& fund, uint64_t timestamp) {
        require_caller(caller, owner_, "FeeLedger::record_settlement");
        std::unique_lock lock(mutex_);
        Record& record = find(fund);
        if (record.entry.last_settled != 0 && timestamp < record.entry.last_settled) {
            throw NotMonotonicError("settlement at " + std::to_string(timestamp) + " precedes last settlement at " +
                                    std::to_string(record.entry.last_settled));
        }
        record.entry.last_settled = timestamp;
    }

    // Apply fn(Entry&) under the write lock
    template <typename Fn>
    void modify(const Address& caller, const FundId& fund, Fn&& fn) {
        require_caller(caller, owner_, "FeeLedger::modify");
        std::unique_lock lock(mutex_);
        Record& record = find(fund);
        Entry updated = record.entry;
        fn(updated);
        record.entry = updated;
    }

    // =========================================================================
    // Shares outstanding bucket
    // =========================================================================

    U256 shares_outstanding(const FundId& fund) const {
        std::shared_lock lock(mutex_);
        return find(fund).shares_outstanding;
    }

    void add_shares_outstanding(const Address& caller, const FundId& fund, const U256& amount) {
        require_caller(caller, owner_, "FeeLedger::add_shares_outstanding");
        std::unique_lock lock(mutex_);
        Record& record = find(fund);
        try {
            record.shares_outstanding = record.shares_outstanding + amount;
        } catch (const std::overflow_error& e) {
            throw ArithmeticOverflowError(std::string("shares outstanding: ") + e.what());
        }
    }

    // Capped at the bucket; returns the quantity actually removed
    U256 remove_shares_outstanding(const Address& caller, const FundId& fund, const U256& amount) {
        require_caller(caller, owner_, "FeeLedger::remove_shares_outstanding");
        std::unique_lock lock(mutex_);
        Record& record = find(fund);
        U256 removed = amount < record.shares_outstanding ? amount : record.shares_outstanding;
        record.shares_outstanding -= removed;
        return removed;
    }

    // Zeroes the bucket; returns what it held
    U256 take_shares_outstanding(const Address& caller, const FundId& fund) {
        require_caller(caller, owner_, "FeeLedger::take_shares_outstanding");
        std::unique_lock lock(mutex_);
        Record& record = find(fund);
        U256 taken = record.shares_outstanding;
        record.shares_outstanding = 0;
        return taken;
    }

    // =========================================================================
    // Checkpoints
    // =========================================================================

    Snapshot snapshot(const FundId& fund) const {
        std::shared_lock lock(mutex_);
        Snapshot snap;
        snap.fund = fund;
        auto it = records_.find(fund);
        if (it != records_.end()) snap.record = it->second;
        return snap;
    }

    void restore(const Address& caller, const Snapshot& snap) {
        require_caller(caller, owner_, "FeeLedger::restore");
        std::unique_lock lock(mutex_);
        if (snap.record) {
            records_[snap.fund] = *snap.record;
        } else {
            records_.erase(snap.fund);
        }
    }

private:
    Record& find(const FundId& fund) {
        auto it = records_.find(fund);
        if (it == records_.end()) {
            throw FundNotInitializedError("no fee settings for fund " + addresses::to_hex(fund));
        }
        return it->second;
    }

    const Record& find(const FundId& fund) const {
        auto it = records_.find(fund);
        if (it == records_.end()) {
            throw FundNotInitializedError("no fee settings for fund " + addresses::to_hex(fund));
        }
        return it->second;
    }

    Address owner_;
    std::unordered_map<FundId, Record, addresses::Hash> records_;
    mutable std::shared_mutex mutex_;
};

// Checkpoint of one fund's record in a FeeLedger
template <typename Entry>
class LedgerCheckpoint : public FeeCheckpoint {
public:
    explicit LedgerCheckpoint(FeeLedger<Entry>& ledger, const FundId& fund)
        : ledger_(ledger), snapshot_(ledger.snapshot(fund)) {}

    void restore() override { ledger_.restore(ledger_.owner(), snapshot_); }

private:
    FeeLedger<Entry>& ledger_;
    typename FeeLedger<Entry>::Snapshot snapshot_;
};

} // namespace enzyme

#endif // ENZYME_FEE_LEDGER_HPP
