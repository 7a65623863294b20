// Enzyme fee engine - Entrance Rate Fee Tests

#include <catch2/catch.hpp>
#include <enzyme/entrance_rate_fee.hpp>

using namespace enzyme;

namespace {

constexpr Address FEE_MANAGER = addresses::from_u16(0x2000);
constexpr Address FEE_ADDRESS = addresses::from_u16(0x2003);
constexpr Address INVESTOR = addresses::from_u16(0x0001);
constexpr Address STRANGER = addresses::from_u16(0x0BAD);
constexpr FundId FUND = addresses::from_u16(0x1000);
constexpr uint64_t T0 = 1600000000;

HookPayload bought(const U256& shares) {
    HookPayload payload;
    payload.investor = INVESTOR;
    payload.shares_bought = shares;
    return payload;
}

FundView view_at(uint64_t now) {
    FundView view;
    view.now = now;
    return view;
}

}  // namespace

TEST_CASE("Entrance rate fee kinds", "[entrance_rate_fee]") {
    SECTION("Only entrance kinds are accepted") {
        REQUIRE_NOTHROW(EntranceRateFee(FeeKind::ENTRANCE_RATE_BURN, FEE_ADDRESS, FEE_MANAGER));
        REQUIRE_NOTHROW(EntranceRateFee(FeeKind::ENTRANCE_RATE_DIRECT, FEE_ADDRESS, FEE_MANAGER));
        REQUIRE_THROWS_AS(EntranceRateFee(FeeKind::MANAGEMENT, FEE_ADDRESS, FEE_MANAGER), InvalidSettingsError);
    }

    SECTION("Settles only after a buy") {
        EntranceRateFee fee(FeeKind::ENTRANCE_RATE_BURN, FEE_ADDRESS, FEE_MANAGER);
        FeeHooks hooks = fee.implemented_hooks();
        REQUIRE(hooks.settles_on(Hook::POST_BUY_SHARES));
        REQUIRE_FALSE(hooks.settles_on(Hook::CONTINUOUS));
        REQUIRE_FALSE(hooks.settles_on(Hook::PRE_BUY_SHARES));
        REQUIRE(hooks.update.empty());
    }

    SECTION("Settings must match the kind") {
        EntranceRateFee fee(FeeKind::ENTRANCE_RATE_BURN, FEE_ADDRESS, FEE_MANAGER);
        REQUIRE_THROWS_AS(fee.add_fund_settings(FEE_MANAGER, FUND, FeeSettings::entrance_rate_direct(WAD / 100)),
                          InvalidSettingsError);
        REQUIRE_THROWS_AS(fee.add_fund_settings(FEE_MANAGER, FUND, FeeSettings::entrance_rate_burn(WAD)),
                          RateOutOfRangeError);
        REQUIRE_FALSE(fee.is_configured(FUND));
    }
}

TEST_CASE("Entrance rate fee settlement", "[entrance_rate_fee]") {
    SECTION("Burn from the buyer") {
        EntranceRateFee fee(FeeKind::ENTRANCE_RATE_BURN, FEE_ADDRESS, FEE_MANAGER);
        fee.add_fund_settings(FEE_MANAGER, FUND, FeeSettings::entrance_rate_burn(wad::from_string("0.01")));

        SettlementInstruction instruction =
            fee.settle(FEE_MANAGER, FUND, view_at(T0), Hook::POST_BUY_SHARES, bought(SHARE_UNIT * 100));
        REQUIRE(instruction.type == SettlementType::BURN);
        REQUIRE(instruction.payer == INVESTOR);
        REQUIRE(instruction.shares_due == SHARE_UNIT);
        REQUIRE(fee.fee_info(FUND).last_settled == T0);
        REQUIRE(fee.fee_info(FUND).rate == wad::from_string("0.01"));
    }

    SECTION("Transfer from the buyer") {
        EntranceRateFee fee(FeeKind::ENTRANCE_RATE_DIRECT, FEE_ADDRESS, FEE_MANAGER);
        fee.add_fund_settings(FEE_MANAGER, FUND, FeeSettings::entrance_rate_direct(wad::from_string("0.05")));

        SettlementInstruction instruction =
            fee.settle(FEE_MANAGER, FUND, view_at(T0), Hook::POST_BUY_SHARES, bought(SHARE_UNIT * 20));
        REQUIRE(instruction.type == SettlementType::DIRECT);
        REQUIRE(instruction.payer == INVESTOR);
        REQUIRE(instruction.shares_due == SHARE_UNIT);
    }

    SECTION("Dust purchases owe nothing") {
        EntranceRateFee fee(FeeKind::ENTRANCE_RATE_BURN, FEE_ADDRESS, FEE_MANAGER);
        fee.add_fund_settings(FEE_MANAGER, FUND, FeeSettings::entrance_rate_burn(wad::from_string("0.01")));

        SettlementInstruction instruction =
            fee.settle(FEE_MANAGER, FUND, view_at(T0), Hook::POST_BUY_SHARES, bought(U256(99)));
        REQUIRE(instruction.type == SettlementType::NONE);
        REQUIRE(fee.fee_info(FUND).last_settled == T0);
    }

    SECTION("Nothing is ever held outstanding") {
        EntranceRateFee fee(FeeKind::ENTRANCE_RATE_BURN, FEE_ADDRESS, FEE_MANAGER);
        fee.add_fund_settings(FEE_MANAGER, FUND, FeeSettings::entrance_rate_burn(wad::from_string("0.01")));
        fee.settle(FEE_MANAGER, FUND, view_at(T0), Hook::POST_BUY_SHARES, bought(SHARE_UNIT * 100));

        REQUIRE(fee.payout(FEE_MANAGER, FUND, T0) == 0);
        REQUIRE(fee.force_payout(FEE_MANAGER, FUND, T0) == 0);
        REQUIRE(fee.shares_outstanding(FUND) == 0);
    }

    SECTION("Only the fee manager settles") {
        EntranceRateFee fee(FeeKind::ENTRANCE_RATE_BURN, FEE_ADDRESS, FEE_MANAGER);
        fee.add_fund_settings(FEE_MANAGER, FUND, FeeSettings::entrance_rate_burn(wad::from_string("0.01")));
        REQUIRE_THROWS_AS(
            fee.settle(STRANGER, FUND, view_at(T0), Hook::POST_BUY_SHARES, bought(SHARE_UNIT * 100)),
            UnauthorizedCallerError);
        REQUIRE(fee.fee_info(FUND).last_settled == 0);
    }
}
