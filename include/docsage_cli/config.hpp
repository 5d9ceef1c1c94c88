#pragma once

#include <chrono>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "docsage_core/errors.hpp"
#include "docsage_core/llm/concurrent_embedder.hpp"
#include "docsage_core/llm/ollama_client.hpp"
#include "docsage_core/services/index_builder.hpp"
#include "docsage_core/types/distance_metric.hpp"

namespace docsage_cli {

class Config {
 public:
  // Chunking and retrieval
  int chunk_size = 1000;
  int chunk_overlap = 200;
  int top_k = 4;
  docsage_core::DistanceMetric distance_metric = docsage_core::DistanceMetric::Euclidean;

  // Ollama
  std::string ollama_url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  std::string generation_model = "llama3.2";

  // Embedding throughput and resilience
  int embedding_concurrency = 4;
  int embedding_batch_size = 64;
  int request_timeout_ms = 30000;
  int max_attempts = 3;
  int initial_backoff_ms = 250;
  int max_backoff_ms = 4000;

  std::string index_path = "./data/index.db";

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw docsage_core::InvalidConfigurationError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception &e) {
      throw docsage_core::InvalidConfigurationError(
          std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw docsage_core::InvalidConfigurationError("Configuration must be a JSON object");
    }

    Config config;
    try {
      // Apply defaults when keys are missing
      config.chunk_size = json_config.value("chunk_size", config.chunk_size);
      config.chunk_overlap = json_config.value("chunk_overlap", config.chunk_overlap);
      config.top_k = json_config.value("top_k", config.top_k);
      config.distance_metric = docsage_core::distance_metric_from_string(
          json_config.value("distance_metric", std::string("euclidean")));

      config.ollama_url = json_config.value("ollama_url", config.ollama_url);
      config.embedding_model = json_config.value("embedding_model", config.embedding_model);
      config.generation_model = json_config.value("generation_model", config.generation_model);

      config.embedding_concurrency =
          json_config.value("embedding_concurrency", config.embedding_concurrency);
      config.embedding_batch_size =
          json_config.value("embedding_batch_size", config.embedding_batch_size);
      config.request_timeout_ms = json_config.value("request_timeout_ms", config.request_timeout_ms);
      config.max_attempts = json_config.value("max_attempts", config.max_attempts);
      config.initial_backoff_ms = json_config.value("initial_backoff_ms", config.initial_backoff_ms);
      config.max_backoff_ms = json_config.value("max_backoff_ms", config.max_backoff_ms);

      config.index_path = json_config.value("index_path", config.index_path);
    } catch (const nlohmann::json::type_error &e) {
      throw docsage_core::InvalidConfigurationError(std::string("Wrong type in configuration: ") +
                                                    e.what());
    }

    config.validate();
    return config;
  }

  docsage_core::OllamaOptions ollama_options() const {
    docsage_core::OllamaOptions options;
    options.url = ollama_url;
    options.embedding_model = embedding_model;
    options.generation_model = generation_model;
    options.request_timeout = std::chrono::milliseconds(request_timeout_ms);
    options.max_connections = embedding_concurrency;
    return options;
  }

  docsage_core::ConcurrencyOptions concurrency_options() const {
    docsage_core::ConcurrencyOptions options;
    options.concurrency = static_cast<size_t>(embedding_concurrency);
    options.request_timeout = std::chrono::milliseconds(request_timeout_ms);
    options.retry.max_attempts = max_attempts;
    options.retry.initial_backoff = std::chrono::milliseconds(initial_backoff_ms);
    options.retry.max_backoff = std::chrono::milliseconds(max_backoff_ms);
    return options;
  }

  docsage_core::IndexBuilderOptions builder_options() const {
    return {.metric = distance_metric, .batch_size = static_cast<size_t>(embedding_batch_size)};
  }

 private:
  void validate() const {
    if (chunk_size <= 0) {
      throw docsage_core::InvalidConfigurationError("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw docsage_core::InvalidConfigurationError(
          "chunk_overlap must be at least 0 and smaller than chunk_size");
    }
    if (top_k <= 0) {
      throw docsage_core::InvalidConfigurationError("top_k must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw docsage_core::InvalidConfigurationError("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw docsage_core::InvalidConfigurationError("embedding_model cannot be empty");
    }
    if (generation_model.empty()) {
      throw docsage_core::InvalidConfigurationError("generation_model cannot be empty");
    }
    if (embedding_concurrency <= 0) {
      throw docsage_core::InvalidConfigurationError("embedding_concurrency must be greater than 0");
    }
    if (embedding_batch_size <= 0) {
      throw docsage_core::InvalidConfigurationError("embedding_batch_size must be greater than 0");
    }
    if (request_timeout_ms <= 0) {
      throw docsage_core::InvalidConfigurationError("request_timeout_ms must be greater than 0");
    }
    if (max_attempts < 1) {
      throw docsage_core::InvalidConfigurationError("max_attempts must be at least 1");
    }
    if (initial_backoff_ms < 0 || max_backoff_ms < initial_backoff_ms) {
      throw docsage_core::InvalidConfigurationError(
          "backoff must satisfy 0 <= initial_backoff_ms <= max_backoff_ms");
    }
    if (index_path.empty()) {
      throw docsage_core::InvalidConfigurationError("index_path cannot be empty");
    }
  }
};

}  // namespace docsage_cli
