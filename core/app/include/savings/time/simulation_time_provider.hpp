#pragma once

#include "savings/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace savings {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: explicitly driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" only changes when told to.
//
// @details
// Lets tests and the simulation mode of the service say "a year has passed"
// without waiting a year:
//
//   SimulationTimeProvider clock(1'700'000'000);
//   ... deposit ...
//   clock.advance_by(kSecondsPerYear);
//   ... balance now reflects one year of interest ...
//
// Internal storage is a std::atomic<int64_t>, so the executor thread may read
// while a test or IPC command writes, without a mutex.
//
// Thread model:
//   advance_time() / advance_by() may be called from any thread.
//   now_seconds() may be called concurrently from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts the clock at start_seconds (0 = the epoch).
  explicit SimulationTimeProvider(std::int64_t start_seconds = 0);

  std::int64_t now_seconds() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_seconds)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to an absolute epoch-second value.
  //
  // @details
  // Monotonicity is not enforced. Moving the clock backwards is allowed for
  // test setups; ledgers treat a clock behind their last update as "no time
  // elapsed" and never move their own timestamp backwards.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_seconds);

  // -------------------------------------------------------------------------
  // advance_by(delta_seconds)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock forward by delta_seconds (atomic add).
  // -------------------------------------------------------------------------
  void advance_by(std::int64_t delta_seconds);

 private:
  std::atomic<std::int64_t> current_time_seconds_;
};

}  // namespace savings
