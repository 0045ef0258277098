#pragma once

#include <atomic>
#include <string>

#include "internal/util/errors.hpp"

namespace collab::util {

/*
  Guard for operations that must never overlap (rebuild, trend refresh).

  A second caller fails immediately with AlreadyRunning instead of queueing.
*/
class SingleFlight {
 public:
  class Ticket {
   public:
    explicit Ticket(std::atomic<bool>& flag) : flag_(flag) {
    }
    ~Ticket() {
      flag_.store(false);
    }

    Ticket(const Ticket&)            = delete;
    Ticket& operator=(const Ticket&) = delete;

   private:
    std::atomic<bool>& flag_;
  };

  Ticket Acquire(const std::string& operation) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
      throw AlreadyRunning(operation + " already running");
    }
    return Ticket(running_);
  }

  bool Running() const {
    return running_.load();
  }

 private:
  std::atomic<bool> running_{false};
};

} // namespace collab::util
