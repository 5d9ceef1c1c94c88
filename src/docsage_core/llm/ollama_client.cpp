#include "docsage_core/llm/ollama_client.hpp"

#include <iostream>
#include <sstream>

#include "docsage_core/errors.hpp"
#include "ollama.hpp"

namespace docsage_core {

OllamaClient::OllamaClient(const OllamaOptions &options)
    : options_(options),
      pool_(options.url, options.max_connections, options.request_timeout) {
  setup_server_connection();
}

OllamaClient::~OllamaClient() {
  pool_.shutdown();
}

void OllamaClient::setup_server_connection() {
  if (options_.embedding_model.empty()) {
    throw InvalidConfigurationError("Ollama embedding model name cannot be empty");
  }
  if (!is_server_available()) {
    throw EmbeddingUnavailableError("Ollama server is not running at " + options_.url,
                                    /*transient*/ true);
  }
}

bool OllamaClient::exceeded_timeout(std::chrono::steady_clock::time_point started) const {
  return std::chrono::steady_clock::now() - started >= options_.request_timeout;
}

EmbeddingVector OllamaClient::embed(const std::string &text) {
  const auto started = std::chrono::steady_clock::now();
  EmbeddingVector embedding;
  try {
    PooledOllama conn(pool_);
    ollama::response response = conn->generate_embeddings(options_.embedding_model, text);

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      throw EmbeddingUnavailableError("Ollama response does not contain an embeddings field");
    }

    // /api/embed answers with an array of arrays; older servers with a flat array
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw EmbeddingUnavailableError("Ollama embeddings field is not an array");
    }
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      embedding = embeddings[0].get<std::vector<float>>();
    } else {
      embedding = embeddings.get<std::vector<float>>();
    }
  } catch (const ollama::exception &e) {
    if (exceeded_timeout(started)) {
      throw TimeoutError("Embedding request to " + options_.url + " timed out after " +
                         std::to_string(options_.request_timeout.count()) + " ms");
    }
    // Connection-level and server-side failures are worth another attempt
    throw EmbeddingUnavailableError("Embedding generation failed: " + std::string(e.what()),
                                    /*transient*/ true);
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingUnavailableError("Malformed embedding response: " + std::string(e.what()));
  }

  validator_.validate(embedding, "Ollama model '" + options_.embedding_model + "'");
  return embedding;
}

size_t OllamaClient::dimension() const {
  return validator_.dimension();
}

std::string OllamaClient::build_prompt(const std::string &question,
                                       const std::vector<std::string> &context) {
  std::stringstream ss;
  ss << "Answer the question using only the numbered context passages below. "
        "If the passages do not contain the answer, say that you do not know.\n\n";
  for (size_t i = 0; i < context.size(); ++i) {
    ss << "[" << (i + 1) << "] " << context[i] << "\n\n";
  }
  ss << "Question: " << question << "\nAnswer:";
  return ss.str();
}

std::string OllamaClient::generate_answer(const std::string &question,
                                          const std::vector<std::string> &context) {
  const std::string prompt = build_prompt(question, context);
  const auto started = std::chrono::steady_clock::now();
  try {
    PooledOllama conn(pool_);
    ollama::response response = conn->generate(options_.generation_model, prompt);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    if (exceeded_timeout(started)) {
      throw TimeoutError("Generation request to " + options_.url + " timed out after " +
                         std::to_string(options_.request_timeout.count()) + " ms");
    }
    throw GenerationError("Answer generation failed: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  PooledOllama conn(pool_);
  return conn->is_running();
}

}  // namespace docsage_core
