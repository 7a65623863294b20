// Enzyme fee engine - Fund Tests

#include <catch2/catch.hpp>
#include <enzyme/entrance_rate_fee.hpp>
#include <enzyme/fund.hpp>
#include <enzyme/management_fee.hpp>
#include <enzyme/performance_fee.hpp>
#include <enzyme/ray_math.hpp>

using namespace enzyme;

namespace {

constexpr FundId FUND = addresses::from_u16(0x1000);
constexpr Address OWNER = addresses::from_u16(0x1001);
constexpr Address VAULT = addresses::from_u16(0x1002);
constexpr Address RECIPIENT = addresses::from_u16(0x1003);
constexpr Address FEE_MANAGER = addresses::from_u16(0x2000);
constexpr Address ALICE = addresses::from_u16(0x0001);
constexpr Address BOB = addresses::from_u16(0x0002);
constexpr Address STRANGER = addresses::from_u16(0x0BAD);
constexpr uint64_t T0 = 1600000000;
constexpr uint64_t DAY = 86400;

U256 shares(uint64_t n) { return SHARE_UNIT * n; }
U256 assets(uint64_t n) { return wad::from_int(n); }

FeeSettings management(SettlementPolicy policy = SettlementPolicy::MINT) {
    return FeeSettings::management(to_per_second_rate(to_i128(wad::from_string("0.1"))), policy);
}

class FundFixture {
public:
    explicit FundFixture(const std::vector<FeeSettings>& settings)
        : clock(T0), manager(FEE_MANAGER, clock), vault(VAULT, OWNER) {
        manager.register_fee(std::make_unique<ManagementFee>(addresses::from_u16(0x2001), FEE_MANAGER));
        manager.register_fee(std::make_unique<PerformanceFee>(addresses::from_u16(0x2002), FEE_MANAGER));
        manager.register_fee(std::make_unique<EntranceRateFee>(FeeKind::ENTRANCE_RATE_BURN,
                                                               addresses::from_u16(0x2003), FEE_MANAGER));
        manager.register_fee(std::make_unique<EntranceRateFee>(FeeKind::ENTRANCE_RATE_DIRECT,
                                                               addresses::from_u16(0x2004), FEE_MANAGER));

        vault.add_accessor(OWNER, FUND);
        vault.add_accessor(OWNER, FEE_MANAGER);

        fund = std::make_unique<Fund>(FUND, OWNER, manager, vault, clock);
        manager.configure_fund(FUND, vault, RECIPIENT, settings);
    }

    ChainClock clock;
    FeeManager manager;
    ShareVault vault;
    std::unique_ptr<Fund> fund;
};

}  // namespace

TEST_CASE("Fund controller must be a vault accessor", "[fund]") {
    ChainClock clock(T0);
    FeeManager manager(FEE_MANAGER, clock);
    ShareVault vault(VAULT, OWNER);
    REQUIRE_THROWS_AS(Fund(FUND, OWNER, manager, vault, clock), UnauthorizedCallerError);
}

TEST_CASE("Clock starts after timestamp 0", "[fund]") {
    REQUIRE_THROWS_AS(ChainClock(0), InvalidSettingsError);

    ChainClock clock(1);
    clock.advance(DAY);
    REQUIRE(clock.now() == DAY + 1);
    REQUIRE_THROWS_AS(clock.set(DAY), NotMonotonicError);
}

TEST_CASE("Buying and redeeming without fees", "[fund]") {
    FundFixture f(std::vector<FeeSettings>{});

    REQUIRE(f.fund->gross_share_value() == SHARE_UNIT);
    REQUIRE(f.fund->buy_shares(ALICE, assets(100)) == shares(100));
    REQUIRE(f.vault.balance_of(ALICE) == shares(100));
    REQUIRE(f.fund->holdings() == assets(100));
    REQUIRE(f.fund->gross_share_value() == SHARE_UNIT);

    SECTION("Redeem pays the pro-rata holdings") {
        REQUIRE(f.fund->redeem_shares(ALICE, shares(40)) == assets(40));
        REQUIRE(f.vault.balance_of(ALICE) == shares(60));
        REQUIRE(f.fund->holdings() == assets(60));
    }

    SECTION("Redeeming more than held is rejected") {
        REQUIRE_THROWS_AS(f.fund->redeem_shares(ALICE, shares(101)), InsufficientSharesError);
        REQUIRE_THROWS_AS(f.fund->redeem_shares(ALICE, 0), InsufficientSharesError);
        REQUIRE_THROWS_AS(f.fund->redeem_shares(BOB, shares(1)), InsufficientSharesError);
        REQUIRE(f.fund->holdings() == assets(100));
    }

    SECTION("Minimum shares not met") {
        REQUIRE_THROWS_AS(f.fund->buy_shares(BOB, assets(10), shares(11)), InvalidSettingsError);
        REQUIRE(f.vault.balance_of(BOB) == 0);
        REQUIRE(f.vault.total_supply() == shares(100));
        REQUIRE(f.fund->holdings() == assets(100));
    }

    SECTION("A GAV source prices the shares") {
        f.fund->set_gav_source([](const FundId&) { return std::optional<U256>(wad::from_int(200)); });
        REQUIRE(f.fund->gross_share_value() == wad::from_int(2));
        REQUIRE(f.fund->buy_shares(BOB, assets(100)) == shares(50));
    }

    SECTION("No GAV, no redemption") {
        f.fund->set_gav_source([](const FundId&) { return std::optional<U256>(); });
        REQUIRE_FALSE(f.fund->gross_asset_value().has_value());
        REQUIRE_THROWS_AS(f.fund->gross_share_value(), GavUnavailableError);
        REQUIRE_THROWS_AS(f.fund->redeem_shares(ALICE, shares(10)), GavUnavailableError);
        REQUIRE(f.vault.balance_of(ALICE) == shares(100));
        REQUIRE(f.fund->holdings() == assets(100));
    }
}

TEST_CASE("Entrance fees on purchase", "[fund]") {
    SECTION("Burned") {
        FundFixture f({FeeSettings::entrance_rate_burn(wad::from_string("0.01"))});
        REQUIRE(f.fund->buy_shares(ALICE, assets(100)) == shares(99));
        REQUIRE(f.vault.total_supply() == shares(99));
        REQUIRE(f.fund->holdings() == assets(100));
        REQUIRE(f.fund->gross_share_value() == assets(100) * SHARE_UNIT / shares(99));
    }

    SECTION("Paid to the fee recipient") {
        FundFixture f({FeeSettings::entrance_rate_direct(wad::from_string("0.05"))});
        REQUIRE(f.fund->buy_shares(ALICE, assets(20)) == shares(19));
        REQUIRE(f.vault.balance_of(RECIPIENT) == shares(1));
        REQUIRE(f.vault.total_supply() == shares(20));
    }
}

TEST_CASE("Management fee over the fund lifecycle", "[fund]") {
    FundFixture f({management()});

    // The first settlement only starts the clock
    f.fund->buy_shares(ALICE, assets(100));
    REQUIRE(f.vault.balance_of(RECIPIENT) == 0);
    REQUIRE(f.manager.get_fee_info_for_fund(FUND, FeeKind::MANAGEMENT).last_settled == T0);

    f.clock.advance(SECONDS_PER_YEAR);

    SECTION("Continuous settlement dilutes holders") {
        // Observers run once the fund is free again
        std::vector<FeeEvent> events;
        std::vector<U256> holdings_seen;
        f.manager.set_event_callback([&](const FeeEvent& event) {
            events.push_back(event);
            holdings_seen.push_back(f.fund->holdings());
        });

        auto applied = f.fund->invoke_continuous_hook();
        REQUIRE(applied.size() == 1);
        const U256 minted = f.vault.balance_of(RECIPIENT);
        REQUIRE(minted == applied[0].instruction.shares_due);
        REQUIRE(minted > shares(9));
        REQUIRE(minted < shares(11));

        REQUIRE(events.size() == 1);
        REQUIRE(events[0].shares == minted);
        REQUIRE(events[0].seconds_since_settlement == SECONDS_PER_YEAR);
        REQUIRE(holdings_seen == std::vector<U256>{assets(100)});
        f.manager.set_event_callback(nullptr);

        // No time has passed since, so redemption settles nothing more
        const U256 paid = f.fund->redeem_shares(ALICE, shares(100));
        REQUIRE(paid == assets(100) * shares(100) / (shares(100) + minted));
        REQUIRE(f.fund->holdings() == assets(100) - paid);
    }

    SECTION("Buying settles the fee before pricing") {
        const U256 received = f.fund->buy_shares(BOB, assets(100));
        const U256 minted = f.vault.balance_of(RECIPIENT);
        REQUIRE(minted > 0);

        const U256 share_value = assets(100) * SHARE_UNIT / (shares(100) + minted);
        REQUIRE(received == assets(100) * SHARE_UNIT / share_value);
    }

    SECTION("A rejected purchase undoes the fee settlement") {
        std::vector<FeeEvent> events;
        f.manager.set_event_callback([&](const FeeEvent& event) { events.push_back(event); });

        REQUIRE_THROWS_AS(f.fund->buy_shares(BOB, assets(1), shares(1000)), InvalidSettingsError);
        REQUIRE(events.empty());
        f.manager.set_event_callback(nullptr);

        REQUIRE(f.vault.balance_of(RECIPIENT) == 0);
        REQUIRE(f.vault.total_supply() == shares(100));
        REQUIRE(f.fund->holdings() == assets(100));
        REQUIRE(f.manager.get_fee_info_for_fund(FUND, FeeKind::MANAGEMENT).last_settled == T0);
    }
}

TEST_CASE("Fund payout of shares outstanding", "[fund]") {
    FundFixture f({management(SettlementPolicy::MINT_SHARES_OUTSTANDING)});
    f.fund->buy_shares(ALICE, assets(100));
    f.clock.advance(DAY);

    // Settles the day's accrual first, then pays it out
    auto paid = f.fund->payout_outstanding({FeeKind::MANAGEMENT});
    REQUIRE(paid.size() == 1);
    REQUIRE(f.vault.balance_of(RECIPIENT) > 0);
    REQUIRE(f.vault.shares_outstanding() == 0);
    REQUIRE(f.manager.get_shares_outstanding(FUND, FeeKind::MANAGEMENT) == 0);

    SECTION("Unknown kind rolls back the settlement too") {
        f.clock.advance(DAY);
        const U256 supply = f.vault.total_supply();
        REQUIRE_THROWS_AS(f.fund->payout_outstanding({FeeKind::PERFORMANCE}), UnknownFeeKindError);
        REQUIRE(f.vault.total_supply() == supply);
        REQUIRE(f.manager.get_fee_info_for_fund(FUND, FeeKind::MANAGEMENT).last_settled == T0 + DAY);
    }
}

TEST_CASE("Fund migration", "[fund]") {
    FundFixture f({FeeSettings::performance(wad::from_string("0.2"), SECONDS_PER_YEAR)});
    f.fund->buy_shares(ALICE, assets(100));

    f.fund->set_gav_source([](const FundId&) { return std::optional<U256>(wad::from_int(120)); });
    f.clock.advance(10);

    SECTION("Owner only") {
        REQUIRE_THROWS_AS(f.fund->migrate(STRANGER), UnauthorizedCallerError);
        REQUIRE(f.fund->migrations() == 0);
        REQUIRE(f.vault.total_supply() == shares(100));
    }

    SECTION("Performance fee crystallized to the recipient") {
        f.fund->migrate(OWNER);
        REQUIRE(f.fund->migrations() == 1);
        REQUIRE(f.vault.balance_of(RECIPIENT) == U256("3448275862068965517"));
        REQUIRE(f.vault.shares_outstanding() == 0);

        // The fund stays usable
        REQUIRE(f.fund->redeem_shares(ALICE, shares(10)) > 0);
    }
}
