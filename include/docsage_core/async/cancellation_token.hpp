#pragma once

#include <atomic>
#include <string>

#include "docsage_core/errors.hpp"

namespace docsage_core::async {

// Cooperative cancellation flag shared between a caller and long-running work.
// Work checks it between units (batches, embedding calls, backoff sleeps).
class CancellationToken {
 public:
  void cancel() {
    cancelled_.store(true);
  }

  bool is_cancelled() const {
    return cancelled_.load();
  }

  void throw_if_cancelled(const std::string &where) const {
    if (is_cancelled()) {
      throw CancelledError(where + " cancelled");
    }
  }

 private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace docsage_core::async
