#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "docsage_core/async/worker_pool.hpp"
#include "docsage_core/llm/embedder.hpp"
#include "docsage_core/llm/embedding_validator.hpp"
#include "docsage_core/llm/retry_policy.hpp"

namespace docsage_core {

struct ConcurrencyOptions {
  size_t concurrency = 4;
  // Deadline for a single attempt against the wrapped embedder
  std::chrono::milliseconds request_timeout{30000};
  RetryPolicy retry;
  // How often a waiting caller re-checks deadlines and cancellation
  std::chrono::milliseconds poll_interval{10};
};

/**
 * @class ConcurrentEmbedder
 * @brief Runs embedding calls of another Embedder on a bounded worker pool.
 *
 * Adds what the pipeline needs around a raw model adapter:
 *  - at most `concurrency` calls in flight;
 *  - a deadline per attempt (TimeoutError when overrun);
 *  - bounded retries with exponential backoff for transient failures;
 *  - cooperative cancellation between calls and during waits;
 *  - validation and dimension pinning of every returned vector.
 *
 * When embed_many fails, queued work is abandoned and the error of the first
 * failing position is rethrown. Calls that are already running finish in the
 * background; their results are discarded.
 */
class ConcurrentEmbedder : public Embedder {
 public:
  ConcurrentEmbedder(std::shared_ptr<Embedder> inner, const ConcurrencyOptions &options);
  ~ConcurrentEmbedder() override = default;

  ConcurrentEmbedder(const ConcurrentEmbedder &) = delete;
  ConcurrentEmbedder &operator=(const ConcurrentEmbedder &) = delete;

  EmbeddingVector embed(const std::string &text) override;
  std::vector<EmbeddingVector> embed_many(const std::vector<std::string> &texts,
                                          const async::CancellationToken *cancel = nullptr) override;
  size_t dimension() const override;

  const ConcurrencyOptions &options() const {
    return options_;
  }

 private:
  struct Job;

  EmbeddingVector run_with_retries(Job &job,
                                   const std::string &text,
                                   const std::atomic<bool> &abandoned);

  std::shared_ptr<Embedder> inner_;
  ConcurrencyOptions options_;
  EmbeddingValidator validator_;
  // Declared last so its threads are joined before the members they use go away
  async::WorkerPool pool_;
};

}  // namespace docsage_core
