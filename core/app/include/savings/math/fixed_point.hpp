#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <string>

namespace savings {

// -----------------------------------------------------------------------------
// Uint: unsigned 256-bit fixed-point carrier
// -----------------------------------------------------------------------------
//
// @brief  Every amount, share count, rate and index in the pool is an unsigned
//         256-bit integer. Values that represent fractions (rates, the index)
//         are scaled by kPrecision (1e18).
//
// @details
// 256 bits leave ample headroom for the intermediate product of two
// 1e18-scaled values (e.g. shares * index ~ 1e39 for 1e21 shares). Being
// unsigned, a rate can never be negative, which keeps the index
// non-decreasing by construction.
//
// Rounding convention: mulDiv() truncates (rounds toward zero), mulDivUp()
// rounds away from zero. Callers choose the direction that favours the pool.
// -----------------------------------------------------------------------------
using Uint = boost::multiprecision::uint256_t;

// 1.0 in 1e18 fixed point. Scale for rates and the index.
inline const Uint kPrecision{1'000'000'000'000'000'000ULL};

// Index value of a freshly created market.
inline const Uint kInitialIndex{kPrecision};

// 365 days. Leap days are not modelled.
inline constexpr std::int64_t kSecondsPerYear = 365LL * 24 * 60 * 60;

// -------------------------------------------------------------------------
// mulDiv(a, b, denominator)
// -------------------------------------------------------------------------
// @brief  floor(a * b / denominator) computed with a 512-bit intermediate.
//
// @throws std::domain_error    if denominator is zero.
// @throws std::overflow_error  if the quotient does not fit in 256 bits.
// -------------------------------------------------------------------------
Uint mulDiv(const Uint& a, const Uint& b, const Uint& denominator);

// -------------------------------------------------------------------------
// mulDivUp(a, b, denominator)
// -------------------------------------------------------------------------
// @brief  ceil(a * b / denominator). Same error behaviour as mulDiv().
// -------------------------------------------------------------------------
Uint mulDivUp(const Uint& a, const Uint& b, const Uint& denominator);

// -------------------------------------------------------------------------
// parseUint(text)
// -------------------------------------------------------------------------
// @brief  Parses a non-negative base-10 integer string ("1000000").
//
// @details
// Amounts travel through JSON as decimal strings because they routinely
// exceed the 53-bit integer range of JSON numbers. Signs, whitespace,
// exponents and fractional parts are rejected.
//
// @throws std::invalid_argument  on an empty or non-digit string.
// @throws std::out_of_range      if the value needs more than 256 bits.
// -------------------------------------------------------------------------
Uint parseUint(const std::string& text);

// Base-10 rendering of value, inverse of parseUint().
std::string toString(const Uint& value);

// whole * kPrecision, e.g. fromWhole(100) is 100 units of a 18-decimal asset.
Uint fromWhole(std::uint64_t whole);

}  // namespace savings
