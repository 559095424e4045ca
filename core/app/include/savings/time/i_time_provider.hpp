#pragma once

#include <cstdint>

namespace savings {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Interest accrues lazily: the ledger reads the clock whenever it advances or
// previews its index, and the elapsed seconds since the last advancement
// decide how much interest applies. Tying that read to an injected provider
// keeps accrual deterministic in tests:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set (or advanced) explicitly.
//
// Resolution is whole seconds. The rate is an annual figure divided by
// kSecondsPerYear, so sub-second precision would not change any result.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads. Writers (e.g.
//   SimulationTimeProvider::advance_by) synchronize internally.
//
// Ownership:
//   Ledgers hold a const reference; they do NOT own the provider. The
//   provider must outlive every ledger that references it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_seconds()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as whole seconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_seconds() const = 0;
};

}  // namespace savings
