#ifndef ENZYME_RAY_MATH_HPP
#define ENZYME_RAY_MATH_HPP

#include "types.hpp"

namespace enzyme {

// =============================================================================
// Ray Math - rate conversion and fee accrual in 1e27 fixed point
// =============================================================================
//
// All functions are pure and integer-only. Any 256-bit overflow surfaces as
// ArithmeticOverflowError, never as a wrapped value.

namespace ray {

// floor(a * b / RAY)
U256 mul(const U256& a, const U256& b);

// x^n in ray fixed point by exponentiation by squaring, flooring every product
U256 rpow(const U256& x, uint64_t n);

} // namespace ray

// Upper bound for a stored per-second rate: the rate of MAX_ANNUAL_RATE_X18
const U256& max_scaled_per_second_rate();

// Annual rate (wad, 0.1e18 = 10%) -> per-second growth factor (ray, >= 1e27).
// Returns the largest x with rpow(x, SECONDS_PER_YEAR) <= 1 + annual rate.
// Throws RateOutOfRangeError for negative rates or rates above
// MAX_ANNUAL_RATE_X18.
U256 to_per_second_rate(I128 annual_rate_x18);

// Inverse of to_per_second_rate, rounded to the nearest wad.
// Throws RateOutOfRangeError unless RAY <= rate <= max_scaled_per_second_rate().
I128 to_annual_rate(const U256& scaled_per_second_rate);

// Shares to mint so holders of shares_supply are diluted by the compounded
// rate over seconds_elapsed:
//   floor(shares_supply * (rpow(rate, seconds_elapsed) - RAY) / RAY)
// Zero elapsed or zero supply returns exactly 0.
U256 shares_due(const U256& scaled_per_second_rate, const U256& shares_supply, uint64_t seconds_elapsed);

} // namespace enzyme

#endif // ENZYME_RAY_MATH_HPP
