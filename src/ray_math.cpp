// =============================================================================
// ray_math.cpp - Rate conversion and fee accrual in ray fixed point
// =============================================================================

#include "enzyme/ray_math.hpp"
#include "enzyme/errors.hpp"

#include <stdexcept>
#include <string>

namespace enzyme {

namespace {

// Runs fn, reporting 256-bit overflow or underflow as ArithmeticOverflowError
template <typename Fn>
U256 checked(const char* what, Fn&& fn) {
    try {
        return fn();
    } catch (const std::overflow_error& e) {
        throw ArithmeticOverflowError(std::string(what) + ": " + e.what());
    } catch (const std::range_error& e) {
        throw ArithmeticOverflowError(std::string(what) + ": " + e.what());
    }
}

U256 rpow_unchecked(const U256& x, uint64_t n) {
    U256 z = (n % 2 != 0) ? x : RAY;
    U256 base = x;
    for (n /= 2; n != 0; n /= 2) {
        base = base * base / RAY;
        if (n % 2 != 0) {
            z = z * base / RAY;
        }
    }
    return z;
}

// (1 + 5 / SECONDS_PER_YEAR)^SECONDS_PER_YEAR ~ e^5 > 1 + MAX_ANNUAL_RATE, so
// the per-second rate of any accepted annual rate lies below this bound.
U256 search_upper_bound() {
    return RAY + RAY * 5 / SECONDS_PER_YEAR + 1;
}

} // namespace

// =============================================================================
// Ray primitives
// =============================================================================

U256 ray::mul(const U256& a, const U256& b) {
    return checked("ray::mul", [&] { return U256(a * b / RAY); });
}

U256 ray::rpow(const U256& x, uint64_t n) {
    return checked("ray::rpow", [&] { return rpow_unchecked(x, n); });
}

// =============================================================================
// Rate Converter
// =============================================================================

const U256& max_scaled_per_second_rate() {
    static const U256 max_rate = to_per_second_rate(MAX_ANNUAL_RATE_X18);
    return max_rate;
}

U256 to_per_second_rate(I128 annual_rate_x18) {
    if (annual_rate_x18 < 0) {
        throw RateOutOfRangeError("annual rate must not be negative");
    }
    if (annual_rate_x18 > MAX_ANNUAL_RATE_X18) {
        throw RateOutOfRangeError("annual rate " + wad::to_string(to_u256(annual_rate_x18)) +
                                  " exceeds maximum " + wad::to_string(to_u256(MAX_ANNUAL_RATE_X18)));
    }

    return checked("to_per_second_rate", [&] {
        const U256 target = (WAD + to_u256(annual_rate_x18)) * WAD_TO_RAY;

        // Invariant: rpow(lo) <= target < rpow(hi)
        U256 lo = RAY;
        U256 hi = search_upper_bound();
        while (hi - lo > 1) {
            U256 mid = lo + (hi - lo) / 2;
            if (rpow_unchecked(mid, SECONDS_PER_YEAR) <= target) {
                lo = mid;
            } else {
                hi = mid;
            }
        }
        return lo;
    });
}

I128 to_annual_rate(const U256& scaled_per_second_rate) {
    if (scaled_per_second_rate < RAY) {
        throw RateOutOfRangeError("per-second rate below one ray: " + scaled_per_second_rate.str());
    }
    if (scaled_per_second_rate > max_scaled_per_second_rate()) {
        throw RateOutOfRangeError("per-second rate above maximum: " + scaled_per_second_rate.str());
    }

    U256 annual_wad = checked("to_annual_rate", [&] {
        U256 growth = rpow_unchecked(scaled_per_second_rate, SECONDS_PER_YEAR) - RAY;
        return U256((growth + WAD_TO_RAY / 2) / WAD_TO_RAY);
    });
    return to_i128(annual_wad);
}

// =============================================================================
// Fee Accrual Calculator
// =============================================================================

U256 shares_due(const U256& scaled_per_second_rate, const U256& shares_supply, uint64_t seconds_elapsed) {
    if (seconds_elapsed == 0 || shares_supply == 0) {
        return 0;
    }
    if (scaled_per_second_rate < RAY) {
        throw RateOutOfRangeError("per-second rate below one ray: " + scaled_per_second_rate.str());
    }

    return checked("shares_due", [&] {
        U256 growth = rpow_unchecked(scaled_per_second_rate, seconds_elapsed) - RAY;
        return U256(shares_supply * growth / RAY);
    });
}

} // namespace enzyme
