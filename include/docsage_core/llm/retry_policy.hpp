#pragma once

#include <algorithm>
#include <chrono>

namespace docsage_core {

// Capped exponential backoff for transient failures of external calls.
struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds initial_backoff{250};
  std::chrono::milliseconds max_backoff{4000};

  // Delay after the given failed attempt (1-based): initial * 2^(attempt-1), capped.
  std::chrono::milliseconds backoff_for(int attempt) const {
    auto delay = initial_backoff;
    for (int i = 1; i < attempt && delay < max_backoff; ++i) {
      delay *= 2;
    }
    return std::min(delay, max_backoff);
  }
};

}  // namespace docsage_core
