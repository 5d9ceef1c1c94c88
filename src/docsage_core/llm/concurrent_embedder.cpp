#include "docsage_core/llm/concurrent_embedder.hpp"

#include <future>
#include <iostream>
#include <thread>

#include "docsage_core/async/cancellation_token.hpp"
#include "docsage_core/errors.hpp"

namespace docsage_core {

namespace {

using Clock = std::chrono::steady_clock;

int64_t now_ticks() {
  return Clock::now().time_since_epoch().count();
}

// Sleeps in short slices so an abandoned batch does not wait out a long backoff.
void interruptible_sleep(std::chrono::milliseconds duration,
                         std::chrono::milliseconds slice,
                         const std::atomic<bool> &abandoned) {
  const auto deadline = Clock::now() + duration;
  while (Clock::now() < deadline) {
    if (abandoned.load()) {
      throw CancelledError("Embedding retry abandoned");
    }
    std::this_thread::sleep_for(std::min<Clock::duration>(slice, deadline - Clock::now()));
  }
}

}  // namespace

struct ConcurrentEmbedder::Job {
  std::promise<EmbeddingVector> promise;
  // steady_clock ticks when the current attempt started, 0 while not calling out
  std::atomic<int64_t> attempt_started{0};
};

ConcurrentEmbedder::ConcurrentEmbedder(std::shared_ptr<Embedder> inner,
                                       const ConcurrencyOptions &options)
    : inner_(std::move(inner)), options_(options), pool_(options.concurrency) {
  if (!inner_) {
    throw InvalidConfigurationError("ConcurrentEmbedder requires an embedder to wrap");
  }
  if (options_.request_timeout.count() <= 0) {
    throw InvalidConfigurationError("request_timeout must be positive");
  }
  if (options_.retry.max_attempts < 1) {
    throw InvalidConfigurationError("max_attempts must be at least 1");
  }
}

EmbeddingVector ConcurrentEmbedder::embed(const std::string &text) {
  return std::move(embed_many({text}).front());
}

std::vector<EmbeddingVector> ConcurrentEmbedder::embed_many(
    const std::vector<std::string> &texts, const async::CancellationToken *cancel) {
  if (cancel) {
    cancel->throw_if_cancelled("Embedding batch");
  }
  if (texts.empty()) {
    return {};
  }

  // Shared with the queued jobs, which may outlive this call
  auto abandoned = std::make_shared<std::atomic<bool>>(false);
  std::vector<std::shared_ptr<Job>> jobs;
  std::vector<std::future<EmbeddingVector>> futures;
  jobs.reserve(texts.size());
  futures.reserve(texts.size());

  for (const auto &text : texts) {
    auto job = std::make_shared<Job>();
    futures.push_back(job->promise.get_future());
    jobs.push_back(job);
    pool_.submit([this, job, text, abandoned]() {
      if (abandoned->load()) {
        job->promise.set_exception(
            std::make_exception_ptr(CancelledError("Embedding request abandoned")));
        return;
      }
      try {
        job->promise.set_value(run_with_retries(*job, text, *abandoned));
      } catch (...) {
        job->promise.set_exception(std::current_exception());
      }
    });
  }

  const auto timeout_ticks =
      std::chrono::duration_cast<Clock::duration>(options_.request_timeout).count();
  std::vector<EmbeddingVector> vectors;
  vectors.reserve(texts.size());

  try {
    for (size_t i = 0; i < futures.size(); ++i) {
      while (futures[i].wait_for(options_.poll_interval) != std::future_status::ready) {
        if (cancel) {
          cancel->throw_if_cancelled("Embedding batch");
        }
        const int64_t now = now_ticks();
        for (size_t j = i; j < jobs.size(); ++j) {
          const int64_t started = jobs[j]->attempt_started.load();
          if (started != 0 && now - started > timeout_ticks) {
            throw TimeoutError("Embedding request for input " + std::to_string(j) +
                               " exceeded " + std::to_string(options_.request_timeout.count()) +
                               " ms");
          }
        }
      }
      EmbeddingVector vector = futures[i].get();
      validator_.validate(vector, "Embedding for input " + std::to_string(i));
      vectors.push_back(std::move(vector));
    }
  } catch (...) {
    abandoned->store(true);
    throw;
  }

  return vectors;
}

EmbeddingVector ConcurrentEmbedder::run_with_retries(Job &job,
                                                     const std::string &text,
                                                     const std::atomic<bool> &abandoned) {
  const RetryPolicy &retry = options_.retry;
  for (int attempt = 1;; ++attempt) {
    job.attempt_started.store(now_ticks());
    try {
      EmbeddingVector vector = inner_->embed(text);
      job.attempt_started.store(0);
      return vector;
    } catch (const TimeoutError &e) {
      job.attempt_started.store(0);
      if (attempt >= retry.max_attempts) {
        throw;
      }
      std::cerr << "[ConcurrentEmbedder] attempt " << attempt << " timed out: " << e.what()
                << std::endl;
    } catch (const EmbeddingUnavailableError &e) {
      job.attempt_started.store(0);
      if (!e.transient() || attempt >= retry.max_attempts) {
        throw;
      }
      std::cerr << "[ConcurrentEmbedder] attempt " << attempt << " failed: " << e.what()
                << std::endl;
    }
    if (abandoned.load()) {
      throw CancelledError("Embedding retry abandoned");
    }
    interruptible_sleep(retry.backoff_for(attempt), options_.poll_interval, abandoned);
  }
}

size_t ConcurrentEmbedder::dimension() const {
  return validator_.dimension();
}

}  // namespace docsage_core
