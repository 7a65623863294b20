// Enzyme fee engine - Management Fee Tests

#include <catch2/catch.hpp>
#include <enzyme/management_fee.hpp>
#include <enzyme/ray_math.hpp>

using namespace enzyme;

namespace {

constexpr Address FEE_MANAGER = addresses::from_u16(0x2000);
constexpr Address FEE_ADDRESS = addresses::from_u16(0x2001);
constexpr Address STRANGER = addresses::from_u16(0x0BAD);
constexpr FundId FUND = addresses::from_u16(0x1000);
constexpr uint64_t T0 = 1600000000;

FundView view_at(uint64_t now, const U256& supply, const U256& outstanding = 0) {
    FundView view;
    view.now = now;
    view.shares_supply = supply;
    view.shares_outstanding = outstanding;
    return view;
}

U256 ten_percent() {
    return to_per_second_rate(to_i128(wad::from_string("0.1")));
}

SettlementInstruction settle(ManagementFee& fee, const FundView& view, Hook hook = Hook::CONTINUOUS) {
    return fee.settle(FEE_MANAGER, FUND, view, hook, HookPayload{});
}

}  // namespace

TEST_CASE("Management fee configuration", "[management_fee]") {
    ManagementFee fee(FEE_ADDRESS, FEE_MANAGER);

    SECTION("Declared hooks") {
        FeeHooks hooks = fee.implemented_hooks();
        REQUIRE(hooks.settles_on(Hook::CONTINUOUS));
        REQUIRE(hooks.settles_on(Hook::PRE_BUY_SHARES));
        REQUIRE(hooks.settles_on(Hook::PRE_REDEEM_SHARES));
        REQUIRE_FALSE(hooks.settles_on(Hook::POST_BUY_SHARES));
        REQUIRE(hooks.update.empty());
        REQUIRE_FALSE(hooks.uses_gav_on_settle);
    }

    SECTION("Settings stored with a fresh settlement clock") {
        fee.add_fund_settings(FEE_MANAGER, FUND, FeeSettings::management(ten_percent()));
        REQUIRE(fee.is_configured(FUND));
        REQUIRE(fee.fee_info(FUND) == FeeLedgerEntry{ten_percent(), 0});

        ManagementFeeInfo info = fee.get_fee_info_for_fund(FUND);
        REQUIRE(info.policy == SettlementPolicy::MINT);
    }

    SECTION("Second configuration is rejected") {
        fee.add_fund_settings(FEE_MANAGER, FUND, FeeSettings::management(ten_percent()));
        REQUIRE_THROWS_AS(fee.add_fund_settings(FEE_MANAGER, FUND, FeeSettings::management(RAY)),
                          AlreadyConfiguredError);
        REQUIRE(fee.fee_info(FUND).rate == ten_percent());
    }

    SECTION("Rate validation") {
        REQUIRE_THROWS_AS(fee.add_fund_settings(FEE_MANAGER, FUND, FeeSettings::management(RAY - 1)),
                          RateOutOfRangeError);
        REQUIRE_THROWS_AS(
            fee.add_fund_settings(FEE_MANAGER, FUND, FeeSettings::management(max_scaled_per_second_rate() + 1)),
            RateOutOfRangeError);
        REQUIRE_FALSE(fee.is_configured(FUND));
    }

    SECTION("Wrong settings kind") {
        REQUIRE_THROWS_AS(fee.add_fund_settings(FEE_MANAGER, FUND, FeeSettings::performance(WAD / 10, 100)),
                          InvalidSettingsError);
    }

    SECTION("Unconfigured fund") {
        REQUIRE_THROWS_AS(settle(fee, view_at(T0, WAD)), FundNotInitializedError);
    }
}

TEST_CASE("Management fee settlement", "[management_fee]") {
    ManagementFee fee(FEE_ADDRESS, FEE_MANAGER);
    fee.add_fund_settings(FEE_MANAGER, FUND, FeeSettings::management(ten_percent()));

    SECTION("First settlement only starts the clock") {
        SettlementInstruction instruction = settle(fee, view_at(T0, WAD * 1000));
        REQUIRE(instruction.type == SettlementType::NONE);
        REQUIRE(instruction.shares_due == 0);
        REQUIRE(fee.fee_info(FUND).last_settled == T0);
    }

    SECTION("Ten seconds on one share") {
        settle(fee, view_at(T0, SHARE_UNIT));
        SettlementInstruction instruction = settle(fee, view_at(T0 + 10, SHARE_UNIT));

        REQUIRE(instruction.type == SettlementType::MINT);
        REQUIRE(instruction.shares_due == shares_due(ten_percent(), SHARE_UNIT, 10));
        REQUIRE(instruction.shares_due > U256(30000000000ULL));
        REQUIRE(instruction.shares_due < U256(31000000000ULL));
        REQUIRE(fee.fee_info(FUND).last_settled == T0 + 10);
    }

    SECTION("Settling twice at the same time is a no-op") {
        settle(fee, view_at(T0, SHARE_UNIT));
        settle(fee, view_at(T0 + 3600, SHARE_UNIT));
        SettlementInstruction again = settle(fee, view_at(T0 + 3600, SHARE_UNIT), Hook::PRE_BUY_SHARES);
        REQUIRE(again.type == SettlementType::NONE);
        REQUIRE(fee.fee_info(FUND).last_settled == T0 + 3600);
    }

    SECTION("Zero supply accrues nothing but still moves the clock") {
        settle(fee, view_at(T0, 0));
        SettlementInstruction instruction = settle(fee, view_at(T0 + 86400, 0));
        REQUIRE(instruction.type == SettlementType::NONE);
        REQUIRE(fee.fee_info(FUND).last_settled == T0 + 86400);
    }

    SECTION("Charged on supply net of shares outstanding") {
        settle(fee, view_at(T0, SHARE_UNIT * 2, SHARE_UNIT));
        SettlementInstruction instruction = settle(fee, view_at(T0 + 86400, SHARE_UNIT * 2, SHARE_UNIT));
        REQUIRE(instruction.shares_due == shares_due(ten_percent(), SHARE_UNIT, 86400));
    }

    SECTION("Time moving backwards is rejected") {
        settle(fee, view_at(T0 + 100, SHARE_UNIT));
        REQUIRE_THROWS_AS(settle(fee, view_at(T0 + 99, SHARE_UNIT)), NotMonotonicError);
        REQUIRE(fee.fee_info(FUND).last_settled == T0 + 100);
    }

    SECTION("Mint policy never pays out") {
        settle(fee, view_at(T0, SHARE_UNIT));
        settle(fee, view_at(T0 + 86400, SHARE_UNIT));
        REQUIRE(fee.payout(FEE_MANAGER, FUND, T0 + 86400) == 0);
        REQUIRE(fee.force_payout(FEE_MANAGER, FUND, T0 + 86400) == 0);
        REQUIRE(fee.shares_outstanding(FUND) == 0);
    }
}

TEST_CASE("Management fee held as shares outstanding", "[management_fee]") {
    ManagementFee fee(FEE_ADDRESS, FEE_MANAGER);
    fee.add_fund_settings(FEE_MANAGER, FUND,
                          FeeSettings::management(ten_percent(), SettlementPolicy::MINT_SHARES_OUTSTANDING));

    settle(fee, view_at(T0, SHARE_UNIT * 100));
    SettlementInstruction instruction = settle(fee, view_at(T0 + 86400, SHARE_UNIT * 100));
    const U256 due = instruction.shares_due;

    REQUIRE(instruction.type == SettlementType::MINT_SHARES_OUTSTANDING);
    REQUIRE(due > 0);
    REQUIRE(fee.shares_outstanding(FUND) == due);

    SECTION("Payout releases the bucket once") {
        REQUIRE(fee.payout(FEE_MANAGER, FUND, T0 + 86400) == due);
        REQUIRE(fee.shares_outstanding(FUND) == 0);
        REQUIRE(fee.payout(FEE_MANAGER, FUND, T0 + 86400) == 0);
        REQUIRE(fee.shares_outstanding(FUND) == 0);
    }

    SECTION("Bucket accumulates across settlements") {
        SettlementInstruction next = settle(fee, view_at(T0 + 2 * 86400, SHARE_UNIT * 100 + due, due));
        REQUIRE(fee.shares_outstanding(FUND) == due + next.shares_due);
    }
}

TEST_CASE("Management fee access control", "[management_fee]") {
    ManagementFee fee(FEE_ADDRESS, FEE_MANAGER);

    REQUIRE_THROWS_AS(fee.add_fund_settings(STRANGER, FUND, FeeSettings::management(ten_percent())),
                      UnauthorizedCallerError);
    REQUIRE_FALSE(fee.is_configured(FUND));

    fee.add_fund_settings(FEE_MANAGER, FUND, FeeSettings::management(ten_percent()));
    settle(fee, view_at(T0, SHARE_UNIT));

    REQUIRE_THROWS_AS(fee.settle(STRANGER, FUND, view_at(T0 + 10, SHARE_UNIT), Hook::CONTINUOUS, HookPayload{}),
                      UnauthorizedCallerError);
    REQUIRE_THROWS_AS(fee.payout(STRANGER, FUND, T0 + 10), UnauthorizedCallerError);
    REQUIRE_THROWS_AS(fee.checkpoint(STRANGER, FUND), UnauthorizedCallerError);
    REQUIRE(fee.fee_info(FUND).last_settled == T0);
}
