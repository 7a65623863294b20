// Enzyme fee engine - Fee Ledger Tests

#include <catch2/catch.hpp>
#include <enzyme/fee_ledger.hpp>

using namespace enzyme;

namespace {

constexpr Address OWNER = addresses::from_u16(0x0A01);
constexpr Address STRANGER = addresses::from_u16(0x0A02);
constexpr FundId FUND = addresses::from_u16(0x0F01);
constexpr FundId OTHER_FUND = addresses::from_u16(0x0F02);

struct TestEntry {
    U256 rate = 0;
    uint64_t last_settled = 0;
};

TestEntry entry(uint64_t rate) {
    TestEntry e;
    e.rate = rate;
    return e;
}

}  // namespace

TEST_CASE("Ledger configuration", "[fee_ledger]") {
    FeeLedger<TestEntry> ledger(OWNER);

    SECTION("Settings are stored once") {
        REQUIRE_FALSE(ledger.has_fund(FUND));
        ledger.add_fund_settings(OWNER, FUND, entry(7));
        REQUIRE(ledger.has_fund(FUND));
        REQUIRE(ledger.get(FUND).rate == 7);
        REQUIRE(ledger.get(FUND).last_settled == 0);
        REQUIRE(ledger.shares_outstanding(FUND) == 0);

        REQUIRE_THROWS_AS(ledger.add_fund_settings(OWNER, FUND, entry(9)), AlreadyConfiguredError);
        REQUIRE(ledger.get(FUND).rate == 7);
    }

    SECTION("Unknown fund") {
        REQUIRE_THROWS_AS(ledger.get(FUND), FundNotInitializedError);
        REQUIRE_THROWS_AS(ledger.shares_outstanding(FUND), FundNotInitializedError);
        REQUIRE_THROWS_AS(ledger.record_settlement(OWNER, FUND, 10), FundNotInitializedError);
    }

    SECTION("Funds are independent") {
        ledger.add_fund_settings(OWNER, FUND, entry(1));
        ledger.add_fund_settings(OWNER, OTHER_FUND, entry(2));
        ledger.record_settlement(OWNER, FUND, 100);
        REQUIRE(ledger.get(FUND).last_settled == 100);
        REQUIRE(ledger.get(OTHER_FUND).last_settled == 0);
    }
}

TEST_CASE("Ledger settlement bookkeeping", "[fee_ledger]") {
    FeeLedger<TestEntry> ledger(OWNER);
    ledger.add_fund_settings(OWNER, FUND, entry(1));

    SECTION("Settlement time only moves forward") {
        ledger.record_settlement(OWNER, FUND, 1000);
        ledger.record_settlement(OWNER, FUND, 1000);
        ledger.record_settlement(OWNER, FUND, 2000);
        REQUIRE(ledger.get(FUND).last_settled == 2000);

        REQUIRE_THROWS_AS(ledger.record_settlement(OWNER, FUND, 1999), NotMonotonicError);
        REQUIRE(ledger.get(FUND).last_settled == 2000);
    }

    SECTION("Modify applies under the write lock") {
        ledger.modify(OWNER, FUND, [](TestEntry& e) { e.rate = 42; });
        REQUIRE(ledger.get(FUND).rate == 42);
    }
}

TEST_CASE("Shares outstanding bucket", "[fee_ledger]") {
    FeeLedger<TestEntry> ledger(OWNER);
    ledger.add_fund_settings(OWNER, FUND, entry(1));

    ledger.add_shares_outstanding(OWNER, FUND, 500);
    REQUIRE(ledger.shares_outstanding(FUND) == 500);

    SECTION("Removal is capped at the bucket") {
        REQUIRE(ledger.remove_shares_outstanding(OWNER, FUND, 200) == 200);
        REQUIRE(ledger.shares_outstanding(FUND) == 300);
        REQUIRE(ledger.remove_shares_outstanding(OWNER, FUND, 1000) == 300);
        REQUIRE(ledger.shares_outstanding(FUND) == 0);
    }

    SECTION("Take zeroes the bucket") {
        REQUIRE(ledger.take_shares_outstanding(OWNER, FUND) == 500);
        REQUIRE(ledger.shares_outstanding(FUND) == 0);
        REQUIRE(ledger.take_shares_outstanding(OWNER, FUND) == 0);
    }
}

TEST_CASE("Ledger access control", "[fee_ledger]") {
    FeeLedger<TestEntry> ledger(OWNER);
    ledger.add_fund_settings(OWNER, FUND, entry(1));
    ledger.record_settlement(OWNER, FUND, 50);
    ledger.add_shares_outstanding(OWNER, FUND, 10);

    REQUIRE_THROWS_AS(ledger.add_fund_settings(STRANGER, OTHER_FUND, entry(1)), UnauthorizedCallerError);
    REQUIRE_THROWS_AS(ledger.record_settlement(STRANGER, FUND, 60), UnauthorizedCallerError);
    REQUIRE_THROWS_AS(ledger.modify(STRANGER, FUND, [](TestEntry& e) { e.rate = 0; }), UnauthorizedCallerError);
    REQUIRE_THROWS_AS(ledger.add_shares_outstanding(STRANGER, FUND, 1), UnauthorizedCallerError);
    REQUIRE_THROWS_AS(ledger.remove_shares_outstanding(STRANGER, FUND, 1), UnauthorizedCallerError);
    REQUIRE_THROWS_AS(ledger.take_shares_outstanding(STRANGER, FUND), UnauthorizedCallerError);

    // State untouched
    REQUIRE_FALSE(ledger.has_fund(OTHER_FUND));
    REQUIRE(ledger.get(FUND).rate == 1);
    REQUIRE(ledger.get(FUND).last_settled == 50);
    REQUIRE(ledger.shares_outstanding(FUND) == 10);
}

TEST_CASE("Ledger checkpoints", "[fee_ledger]") {
    FeeLedger<TestEntry> ledger(OWNER);

    SECTION("Restore puts back an existing record") {
        ledger.add_fund_settings(OWNER, FUND, entry(1));
        LedgerCheckpoint<TestEntry> checkpoint(ledger, FUND);

        ledger.record_settlement(OWNER, FUND, 99);
        ledger.add_shares_outstanding(OWNER, FUND, 5);
        checkpoint.restore();

        REQUIRE(ledger.get(FUND).last_settled == 0);
        REQUIRE(ledger.shares_outstanding(FUND) == 0);
    }

    SECTION("Restore removes a record created after the checkpoint") {
        LedgerCheckpoint<TestEntry> checkpoint(ledger, FUND);
        ledger.add_fund_settings(OWNER, FUND, entry(1));
        checkpoint.restore();
        REQUIRE_FALSE(ledger.has_fund(FUND));
    }

    SECTION("Only the owner restores") {
        ledger.add_fund_settings(OWNER, FUND, entry(1));
        auto snap = ledger.snapshot(FUND);
        REQUIRE_THROWS_AS(ledger.restore(STRANGER, snap), UnauthorizedCallerError);
    }
}
