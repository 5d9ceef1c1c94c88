#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "docsage_core/llm/answer_generator.hpp"
#include "docsage_core/llm/embedder.hpp"
#include "docsage_core/llm/embedding_validator.hpp"
#include "docsage_core/llm/ollama_connection_pool.hpp"

namespace docsage_core {

struct OllamaOptions {
  std::string url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  std::string generation_model = "llama3.2";
  std::chrono::milliseconds request_timeout{30000};
  int max_connections = 4;
};

class OllamaClient : public Embedder, public AnswerGenerator {
 public:
  // Throws EmbeddingUnavailableError if the server does not answer.
  explicit OllamaClient(const OllamaOptions &options);
  ~OllamaClient() override;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  EmbeddingVector embed(const std::string &text) override;
  size_t dimension() const override;

  std::string generate_answer(const std::string &question,
                              const std::vector<std::string> &context) override;

  virtual bool is_server_available();

  const OllamaOptions &options() const {
    return options_;
  }

  // The grounded prompt sent to the generation model.
  static std::string build_prompt(const std::string &question,
                                  const std::vector<std::string> &context);

 private:
  OllamaOptions options_;
  OllamaConnectionPool pool_;
  EmbeddingValidator validator_;

  // Helper methods
  void setup_server_connection();
  bool exceeded_timeout(std::chrono::steady_clock::time_point started) const;
};

}  // namespace docsage_core
