#include "docsage_core/llm/ollama_connection_pool.hpp"

#include <algorithm>

#include "docsage_core/errors.hpp"
#include "ollama.hpp"

namespace docsage_core {

OllamaConnectionPool::OllamaConnectionPool(const std::string& server_url,
                                           int pool_size,
                                           std::chrono::milliseconds request_timeout)
    : server_url_(server_url) {
  if (pool_size <= 0) {
    throw InvalidConfigurationError("Ollama connection pool size must be greater than 0");
  }
  // httplib timeouts have one-second granularity; round up so a short timeout is never zero
  auto seconds = std::chrono::ceil<std::chrono::seconds>(request_timeout).count();
  const int timeout_seconds = static_cast<int>(std::max<long long>(1, seconds));

  for (int i = 0; i < pool_size; ++i) {
    auto conn = std::make_unique<Ollama>(server_url_);
    conn->setReadTimeout(timeout_seconds);
    conn->setWriteTimeout(timeout_seconds);
    pool_.push(std::move(conn));
  }
}

OllamaConnectionPool::~OllamaConnectionPool() = default;

std::unique_ptr<Ollama> OllamaConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  // Wait until a connection is available or shutdown is requested
  cv_.wait(lock, [this] { return shutting_down_ || !pool_.empty(); });

  if (shutting_down_) {
    throw EmbeddingUnavailableError("Ollama connection pool is shut down");
  }

  std::unique_ptr<Ollama> conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

void OllamaConnectionPool::return_connection(std::unique_ptr<Ollama> conn) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!shutting_down_) {
    pool_.push(std::move(conn));
  }
  // Notify one waiting thread that a connection is available
  cv_.notify_one();
}

void OllamaConnectionPool::shutdown() {
  std::lock_guard<std::mutex> lock(mtx_);
  shutting_down_ = true;
  while (!pool_.empty()) {
    pool_.pop();
  }
  cv_.notify_all();
}

PooledOllama::PooledOllama(OllamaConnectionPool& pool)
    : pool_(pool), conn_(pool.get_connection()) {}

PooledOllama::~PooledOllama() {
  if (conn_) {
    pool_.return_connection(std::move(conn_));
  }
}

}  // namespace docsage_core
