#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

class Ollama;

namespace docsage_core {

// Bounded set of ollama-hpp connections. Each Ollama object wraps one HTTP
// client, so concurrent callers each borrow their own.
class OllamaConnectionPool {
public:
    OllamaConnectionPool(const std::string& server_url, int pool_size,
                         std::chrono::milliseconds request_timeout);
    ~OllamaConnectionPool();

    // Blocks until a connection is free.
    std::unique_ptr<Ollama> get_connection();

    // Returns a connection to the pool.
    void return_connection(std::unique_ptr<Ollama> conn);
    void shutdown();

private:
    bool shutting_down_ = false;
    std::string server_url_;
    std::queue<std::unique_ptr<Ollama>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

class PooledOllama {
public:
    // Constructor borrows a connection from the pool
    explicit PooledOllama(OllamaConnectionPool& pool);

    // Destructor automatically returns the connection
    ~PooledOllama();

    Ollama* operator->() const { return conn_.get(); }
    Ollama& operator*() const { return *conn_; }

    // Delete copy/move to prevent ownership issues
    PooledOllama(const PooledOllama&) = delete;
    PooledOllama& operator=(const PooledOllama&) = delete;

private:
    OllamaConnectionPool& pool_;
    std::unique_ptr<Ollama> conn_;
};

}  // namespace docsage_core
