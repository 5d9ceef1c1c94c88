#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "docsage_core/errors.hpp"
#include "docsage_core/llm/ollama_connection_pool.hpp"
#include "ollama.hpp"

namespace docsage_core {

// Connections are created lazily by the HTTP client, so no server is needed here.
class OllamaConnectionPoolTest : public ::testing::Test {
 protected:
  OllamaConnectionPool pool_{"http://localhost:11434", 2, std::chrono::milliseconds(1000)};
};

TEST_F(OllamaConnectionPoolTest, RejectsEmptyPool) {
  EXPECT_THROW(OllamaConnectionPool("http://localhost:11434", 0, std::chrono::milliseconds(1000)),
               InvalidConfigurationError);
}

TEST_F(OllamaConnectionPoolTest, LeaseReturnsConnectionOnScopeExit) {
  {
    PooledOllama first(pool_);
    PooledOllama second(pool_);
  }
  // Both connections are back; leasing them again must not block
  PooledOllama again(pool_);
  PooledOllama and_again(pool_);
  SUCCEED();
}

TEST_F(OllamaConnectionPoolTest, ShutdownSurfacesAsEmbeddingUnavailable) {
  pool_.shutdown();

  EXPECT_THROW(pool_.get_connection(), EmbeddingUnavailableError);
  EXPECT_THROW({ PooledOllama lease(pool_); }, DocsageError);
}

}  // namespace docsage_core
