#include <gtest/gtest.h>

#include <chrono>

#include "docsage_cli/config.hpp"
#include "utilities_test.hpp"

namespace docsage_cli {

using docsage_core::DistanceMetric;
using docsage_core::InvalidConfigurationError;
using docsage_tests::TempFileTestBase;
using docsage_tests::TestUtilities;

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.chunk_size, 1000);
  EXPECT_EQ(cfg.chunk_overlap, 200);
  EXPECT_EQ(cfg.top_k, 4);
  EXPECT_EQ(cfg.distance_metric, DistanceMetric::Euclidean);
  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "mxbai-embed-large");
  EXPECT_EQ(cfg.generation_model, "llama3.2");
  EXPECT_EQ(cfg.embedding_concurrency, 4);
  EXPECT_EQ(cfg.embedding_batch_size, 64);
  EXPECT_EQ(cfg.request_timeout_ms, 30000);
  EXPECT_EQ(cfg.max_attempts, 3);
  EXPECT_EQ(cfg.index_path, "./data/index.db");
}

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {{"chunk_size", 500},
                      {"chunk_overlap", 50},
                      {"top_k", 6},
                      {"distance_metric", "cosine"},
                      {"embedding_model", "nomic-embed-text"},
                      {"embedding_concurrency", 2},
                      {"index_path", "/tmp/manual.db"}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.chunk_size, 500);
  EXPECT_EQ(cfg.chunk_overlap, 50);
  EXPECT_EQ(cfg.top_k, 6);
  EXPECT_EQ(cfg.distance_metric, DistanceMetric::Cosine);
  EXPECT_EQ(cfg.embedding_model, "nomic-embed-text");
  EXPECT_EQ(cfg.embedding_concurrency, 2);
  EXPECT_EQ(cfg.index_path, "/tmp/manual.db");
}

TEST(ConfigTest, RejectsInvalidChunkSettings) {
  EXPECT_THROW(Config::from_json({{"chunk_size", 0}}), InvalidConfigurationError);
  EXPECT_THROW(Config::from_json({{"chunk_size", 100}, {"chunk_overlap", 100}}),
               InvalidConfigurationError);
  EXPECT_THROW(Config::from_json({{"chunk_overlap", -1}}), InvalidConfigurationError);
  EXPECT_THROW(Config::from_json({{"top_k", 0}}), InvalidConfigurationError);
}

TEST(ConfigTest, RejectsInvalidResilienceSettings) {
  EXPECT_THROW(Config::from_json({{"embedding_concurrency", 0}}), InvalidConfigurationError);
  EXPECT_THROW(Config::from_json({{"embedding_batch_size", 0}}), InvalidConfigurationError);
  EXPECT_THROW(Config::from_json({{"request_timeout_ms", 0}}), InvalidConfigurationError);
  EXPECT_THROW(Config::from_json({{"max_attempts", 0}}), InvalidConfigurationError);
  EXPECT_THROW(Config::from_json({{"initial_backoff_ms", 500}, {"max_backoff_ms", 100}}),
               InvalidConfigurationError);
}

TEST(ConfigTest, RejectsEmptyStrings) {
  EXPECT_THROW(Config::from_json({{"ollama_url", ""}}), InvalidConfigurationError);
  EXPECT_THROW(Config::from_json({{"embedding_model", ""}}), InvalidConfigurationError);
  EXPECT_THROW(Config::from_json({{"index_path", ""}}), InvalidConfigurationError);
}

TEST(ConfigTest, RejectsWrongTypes) {
  EXPECT_THROW(Config::from_json({{"chunk_size", "large"}}), InvalidConfigurationError);
  EXPECT_THROW(Config::from_json({{"ollama_url", 42}}), InvalidConfigurationError);
  EXPECT_THROW(Config::from_json(nlohmann::json::array()), InvalidConfigurationError);
}

TEST(ConfigTest, RejectsUnknownMetric) {
  EXPECT_THROW(Config::from_json({{"distance_metric", "manhattan"}}), InvalidConfigurationError);
}

TEST(ConfigTest, ConvertsToCoreOptions) {
  Config cfg = Config::from_json({{"embedding_concurrency", 3},
                                  {"embedding_batch_size", 16},
                                  {"request_timeout_ms", 1500},
                                  {"max_attempts", 5},
                                  {"initial_backoff_ms", 10},
                                  {"max_backoff_ms", 80},
                                  {"distance_metric", "cosine"}});

  docsage_core::ConcurrencyOptions concurrency = cfg.concurrency_options();
  EXPECT_EQ(concurrency.concurrency, 3u);
  EXPECT_EQ(concurrency.request_timeout, std::chrono::milliseconds(1500));
  EXPECT_EQ(concurrency.retry.max_attempts, 5);
  EXPECT_EQ(concurrency.retry.initial_backoff, std::chrono::milliseconds(10));
  EXPECT_EQ(concurrency.retry.max_backoff, std::chrono::milliseconds(80));

  docsage_core::OllamaOptions ollama = cfg.ollama_options();
  EXPECT_EQ(ollama.embedding_model, "mxbai-embed-large");
  EXPECT_EQ(ollama.request_timeout, std::chrono::milliseconds(1500));

  docsage_core::IndexBuilderOptions builder = cfg.builder_options();
  EXPECT_EQ(builder.metric, DistanceMetric::Cosine);
  EXPECT_EQ(builder.batch_size, 16u);
}

class ConfigFileTest : public TempFileTestBase {};

TEST_F(ConfigFileTest, LoadsFromFile) {
  auto path = temp_path(".json");
  TestUtilities::write_file(path, R"({"chunk_size": 300, "chunk_overlap": 30})");

  Config cfg = Config::from_file(path.string());

  EXPECT_EQ(cfg.chunk_size, 300);
  EXPECT_EQ(cfg.chunk_overlap, 30);
}

TEST_F(ConfigFileTest, MissingFileThrows) {
  EXPECT_THROW(Config::from_file(TestUtilities::create_temp_path(".json").string()),
               InvalidConfigurationError);
}

TEST_F(ConfigFileTest, MalformedJsonThrows) {
  auto path = temp_path(".json");
  TestUtilities::write_file(path, "{ not json");

  EXPECT_THROW(Config::from_file(path.string()), InvalidConfigurationError);
}

}  // namespace docsage_cli
