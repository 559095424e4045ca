#include "savings/math/fixed_point.hpp"

#include <limits>
#include <stdexcept>

namespace savings {

namespace {

using Wide = boost::multiprecision::uint512_t;

// Largest value representable in Uint, widened for range checks.
const Wide kUintMax{std::numeric_limits<Uint>::max()};

// Longest decimal string that can still fit in 256 bits (2^256 ~ 1.16e77).
constexpr std::size_t kMaxDigits = 78;

Uint narrow(const Wide& value) {
  if (value > kUintMax) {
    throw std::overflow_error("fixed-point result exceeds 256 bits");
  }
  return static_cast<Uint>(value);
}

}  // namespace

// -----------------------------------------------------------------------------
// mulDiv(): truncating multiply-then-divide
// -----------------------------------------------------------------------------
Uint mulDiv(const Uint& a, const Uint& b, const Uint& denominator) {
  if (denominator == 0) {
    throw std::domain_error("mulDiv: division by zero");
  }
  Wide product = Wide(a) * Wide(b);
  return narrow(product / Wide(denominator));
}

// -----------------------------------------------------------------------------
// mulDivUp(): multiply-then-divide rounding up on any remainder
// -----------------------------------------------------------------------------
Uint mulDivUp(const Uint& a, const Uint& b, const Uint& denominator) {
  if (denominator == 0) {
    throw std::domain_error("mulDivUp: division by zero");
  }
  Wide product = Wide(a) * Wide(b);
  Wide quotient = product / Wide(denominator);
  if (product % Wide(denominator) != 0) {
    ++quotient;
  }
  return narrow(quotient);
}

// -----------------------------------------------------------------------------
// parseUint(): strict decimal parse
// -----------------------------------------------------------------------------
Uint parseUint(const std::string& text) {
  if (text.empty()) {
    throw std::invalid_argument("empty amount");
  }
  for (char c : text) {
    if (c < '0' || c > '9') {
      throw std::invalid_argument("amount is not a decimal integer: " + text);
    }
  }
  if (text.size() > kMaxDigits) {
    throw std::out_of_range("amount exceeds 256 bits: " + text);
  }

  // Accumulate in 512 bits so a 78-digit value above 2^256 is detected
  // instead of silently wrapping.
  Wide value = 0;
  for (char c : text) {
    value = value * 10 + static_cast<unsigned>(c - '0');
  }
  if (value > kUintMax) {
    throw std::out_of_range("amount exceeds 256 bits: " + text);
  }
  return static_cast<Uint>(value);
}

std::string toString(const Uint& value) { return value.str(); }

Uint fromWhole(std::uint64_t whole) { return Uint(whole) * kPrecision; }

}  // namespace savings
