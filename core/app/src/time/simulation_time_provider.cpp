#include "savings/time/simulation_time_provider.hpp"

namespace savings {

SimulationTimeProvider::SimulationTimeProvider(std::int64_t start_seconds)
    : current_time_seconds_(start_seconds) {}

std::int64_t SimulationTimeProvider::now_seconds() const {
  return current_time_seconds_.load();
}

void SimulationTimeProvider::advance_time(std::int64_t new_time_seconds) {
  current_time_seconds_.store(new_time_seconds);
}

// -----------------------------------------------------------------------------
// advance_by(): fetch_add so two concurrent advances are both applied
// -----------------------------------------------------------------------------
void SimulationTimeProvider::advance_by(std::int64_t delta_seconds) {
  current_time_seconds_.fetch_add(delta_seconds);
}

}  // namespace savings
