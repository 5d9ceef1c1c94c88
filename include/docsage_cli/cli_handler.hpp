#pragma once

#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "docsage_cli/config.hpp"
#include "docsage_core/async/cancellation_token.hpp"
#include "docsage_core/llm/answer_generator.hpp"
#include "docsage_core/llm/embedder.hpp"

namespace docsage_cli {

enum class Command { Build, Query, Ask, Chunk, Info, Help };

struct CliOptions {
  Command command = Command::Help;
  std::string document_path;
  std::string index_path;  // empty: use the configured index_path
  std::string query;
  std::string config_path;
  int top_k = 0;  // 0: use the configured top_k
  bool force = false;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The model-facing collaborators a command needs.
struct Backends {
  std::shared_ptr<docsage_core::Embedder> embedder;
  std::shared_ptr<docsage_core::AnswerGenerator> generator;
};
using BackendFactory = std::function<Backends(const Config &)>;

class CliHandler {
 public:
  // Without a factory, backends are an OllamaClient behind a ConcurrentEmbedder.
  explicit CliHandler(Config config,
                      BackendFactory backend_factory = {},
                      std::ostream &out = std::cout,
                      std::ostream &err = std::cerr);

  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  // Parse command line arguments. Throws CliError on bad usage.
  static CliOptions parse_arguments(int argc, char *argv[]);

  // Runs a command and returns the process exit code. Errors from the core propagate.
  int execute_command(const CliOptions &options,
                      const docsage_core::async::CancellationToken *cancel = nullptr);

  static void print_help(std::ostream &out);

 private:
  Config config_;
  BackendFactory backend_factory_;
  std::ostream &out_;
  std::ostream &err_;
  std::unique_ptr<Backends> backends_;

  // Command handlers
  int handle_build_command(const CliOptions &options,
                           const docsage_core::async::CancellationToken *cancel);
  int handle_query_command(const CliOptions &options);
  int handle_ask_command(const CliOptions &options);
  int handle_chunk_command(const CliOptions &options);
  int handle_info_command(const CliOptions &options);

  // Helper methods
  Backends &backends();
  std::string resolve_index_path(const CliOptions &options) const;
  int resolve_top_k(const CliOptions &options) const;
  static Backends make_ollama_backends(const Config &config);
};

}  // namespace docsage_cli
