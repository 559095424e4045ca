#pragma once

#include "savings/domain/ledger_error.hpp"

#include <string>

namespace savings {

// -----------------------------------------------------------------------------
// ReentrancyGuard: mutual-exclusion flag for pool entry points
// -----------------------------------------------------------------------------
//
// @brief  Rejects a call into a guarded entry point while another guarded
//         call on the same object is still in flight.
//
// @details
// deposit() and withdraw() call out to custody in the middle of their work.
// A custody implementation that calls back into the pool would otherwise see
// half-applied state. Each guarded entry point opens a Scope first:
//
//   ReentrancyGuard::Scope scope(guard_, "withdraw");
//
// The Scope sets the flag on construction and clears it on destruction, so
// the flag is released on every exit path, including exceptions. A second
// Scope on an entered guard throws LedgerError(ReentrantCall); it does not
// wait or queue.
//
// Thread model: a plain bool. Concurrency between threads is handled by the
// service executor; this only catches same-thread re-entry.
// -----------------------------------------------------------------------------
class ReentrancyGuard {
 public:
  class Scope {
   public:
    Scope(ReentrancyGuard& guard, const char* entry_point) : guard_(guard) {
      if (guard_.entered_) {
        throw LedgerError(LedgerErrorCode::ReentrantCall,
                          std::string("reentrant call into ") + entry_point);
      }
      guard_.entered_ = true;
    }

    ~Scope() { guard_.entered_ = false; }

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

   private:
    ReentrancyGuard& guard_;
  };

  bool entered() const { return entered_; }

 private:
  bool entered_{false};
};

}  // namespace savings
