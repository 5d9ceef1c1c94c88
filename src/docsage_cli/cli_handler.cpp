#include "docsage_cli/cli_handler.hpp"

#include <filesystem>
#include <iomanip>
#include <stdexcept>

#include "docsage_core/db/index_snapshot_store.hpp"
#include "docsage_core/llm/concurrent_embedder.hpp"
#include "docsage_core/llm/ollama_client.hpp"
#include "docsage_core/loaders/document_loader_factory.hpp"
#include "docsage_core/services/answer_service.hpp"
#include "docsage_core/services/fingerprint_service.hpp"
#include "docsage_core/services/index_builder.hpp"
#include "docsage_core/services/retriever.hpp"

namespace docsage_cli {

namespace {

constexpr size_t PREVIEW_LENGTH = 100;

std::string preview(const std::string &content) {
  std::string line = content.substr(0, PREVIEW_LENGTH);
  for (char &c : line) {
    if (c == '\n') {
      c = ' ';
    }
  }
  if (content.length() > PREVIEW_LENGTH) {
    line += "...";
  }
  return line;
}

int parse_top_k(const std::string &value) {
  int top_k = 0;
  try {
    size_t consumed = 0;
    top_k = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("--top-k expects an integer, got '" + value + "'");
    }
  } catch (const std::invalid_argument &) {
    throw CliError("--top-k expects an integer, got '" + value + "'");
  } catch (const std::out_of_range &) {
    throw CliError("--top-k is out of range: " + value);
  }
  if (top_k <= 0) {
    throw CliError("--top-k must be greater than 0");
  }
  return top_k;
}

}  // namespace

CliHandler::CliHandler(Config config,
                       BackendFactory backend_factory,
                       std::ostream &out,
                       std::ostream &err)
    : config_(std::move(config)),
      backend_factory_(std::move(backend_factory)),
      out_(out),
      err_(err) {
  if (!backend_factory_) {
    backend_factory_ = &CliHandler::make_ollama_backends;
  }
}

Backends CliHandler::make_ollama_backends(const Config &config) {
  auto ollama = std::make_shared<docsage_core::OllamaClient>(config.ollama_options());
  auto embedder =
      std::make_shared<docsage_core::ConcurrentEmbedder>(ollama, config.concurrency_options());
  return {embedder, ollama};
}

Backends &CliHandler::backends() {
  if (!backends_) {
    backends_ = std::make_unique<Backends>(backend_factory_(config_));
    if (!backends_->embedder || !backends_->generator) {
      throw CliError("Backend factory returned an incomplete set of backends");
    }
  }
  return *backends_;
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;

  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[1];
  if (command == "build" || command == "b") {
    options.command = Command::Build;
  } else if (command == "query" || command == "q") {
    options.command = Command::Query;
  } else if (command == "ask" || command == "a") {
    options.command = Command::Ask;
  } else if (command == "chunk" || command == "c") {
    options.command = Command::Chunk;
  } else if (command == "info" || command == "i") {
    options.command = Command::Info;
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command);
  }

  for (int i = 2; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag == "--force") {
      options.force = true;
      continue;
    }
    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    std::string value = argv[++i];

    if (flag == "--document" || flag == "-d") {
      options.document_path = value;
    } else if (flag == "--index" || flag == "-i") {
      options.index_path = value;
    } else if (flag == "--query" || flag == "-q") {
      options.query = value;
    } else if (flag == "--top-k" || flag == "-k") {
      options.top_k = parse_top_k(value);
    } else if (flag == "--config" || flag == "-c") {
      options.config_path = value;
    } else {
      throw CliError("Unknown option: " + flag);
    }
  }

  switch (options.command) {
    case Command::Build:
    case Command::Chunk:
      if (options.document_path.empty()) {
        throw CliError(command + " command requires a document. Usage: " + command +
                       " --document <path>");
      }
      break;
    case Command::Query:
    case Command::Ask:
      if (options.query.empty()) {
        throw CliError(command + " command requires a query. Usage: " + command +
                       " --query <text>");
      }
      break;
    default:
      break;
  }
  return options;
}

int CliHandler::execute_command(const CliOptions &options,
                                const docsage_core::async::CancellationToken *cancel) {
  switch (options.command) {
    case Command::Build:
      return handle_build_command(options, cancel);
    case Command::Query:
      return handle_query_command(options);
    case Command::Ask:
      return handle_ask_command(options);
    case Command::Chunk:
      return handle_chunk_command(options);
    case Command::Info:
      return handle_info_command(options);
    case Command::Help:
      print_help(out_);
      return 0;
  }
  return 0;
}

std::string CliHandler::resolve_index_path(const CliOptions &options) const {
  return options.index_path.empty() ? config_.index_path : options.index_path;
}

int CliHandler::resolve_top_k(const CliOptions &options) const {
  return options.top_k > 0 ? options.top_k : config_.top_k;
}

int CliHandler::handle_build_command(const CliOptions &options,
                                     const docsage_core::async::CancellationToken *cancel) {
  docsage_core::DocumentLoaderFactory loaders;
  docsage_core::Document document = loaders.load(options.document_path);
  const std::string fingerprint = docsage_core::FingerprintService::fingerprint(document);

  docsage_core::IndexSnapshotStore store(resolve_index_path(options));
  if (!options.force) {
    std::optional<docsage_core::SnapshotInfo> existing = store.read_info();
    if (existing && existing->document_fingerprint == fingerprint &&
        existing->embedding_model == config_.embedding_model &&
        existing->metric == config_.distance_metric &&
        existing->chunk_size == config_.chunk_size &&
        existing->chunk_overlap == config_.chunk_overlap) {
      out_ << "Index at " << store.path().string() << " is up to date (" << existing->chunk_count
           << " chunks). Use --force to rebuild." << std::endl;
      return 0;
    }
  }

  out_ << "Building index for " << options.document_path << " (" << document.page_count()
       << " pages)" << std::endl;

  docsage_core::IndexBuilder builder(backends().embedder, config_.builder_options());
  auto on_progress = [this](float progress, const std::string &message) {
    out_ << "  [" << std::setw(3) << static_cast<int>(progress * 100.0f) << "%] " << message
         << std::endl;
  };
  std::unique_ptr<docsage_core::VectorIndex> index =
      builder.build(document, config_.chunk_size, config_.chunk_overlap, on_progress, cancel);

  docsage_core::SnapshotInfo info;
  info.embedding_model = config_.embedding_model;
  info.chunk_size = config_.chunk_size;
  info.chunk_overlap = config_.chunk_overlap;
  info.document_fingerprint = fingerprint;
  info.document_source = document.source();
  info.created_at = std::chrono::system_clock::now();
  store.save(*index, info);

  out_ << "Indexed " << index->size() << " chunks (dimension " << index->dimension() << ", "
       << docsage_core::to_string(index->metric()) << ") into " << store.path().string()
       << std::endl;
  return 0;
}

int CliHandler::handle_query_command(const CliOptions &options) {
  docsage_core::IndexSnapshotStore store(resolve_index_path(options),
                                         docsage_core::IndexSnapshotStore::OpenMode::ExistingOnly);
  std::optional<docsage_core::SnapshotInfo> info = store.read_info();
  if (info && info->embedding_model != config_.embedding_model) {
    err_ << "Warning: index was built with '" << info->embedding_model << "' but '"
         << config_.embedding_model << "' is configured" << std::endl;
  }
  std::shared_ptr<const docsage_core::VectorIndex> index = store.load();

  docsage_core::Retriever retriever(index, backends().embedder);
  const int top_k = resolve_top_k(options);
  std::vector<docsage_core::ScoredChunk> hits = retriever.retrieve_scored(options.query, top_k);

  out_ << "\n=== Results for: " << options.query << " (top_k: " << top_k << ") ===" << std::endl;
  if (hits.empty()) {
    out_ << "No results found." << std::endl;
    return 0;
  }
  for (size_t rank = 0; rank < hits.size(); ++rank) {
    const auto &hit = hits[rank];
    out_ << "  " << (rank + 1) << ". chunk " << hit.chunk.sequence_index << " (page "
         << (hit.chunk.source_page_index + 1) << ") | distance: " << std::fixed
         << std::setprecision(4) << hit.distance << std::endl;
    out_ << "     " << preview(hit.chunk.content) << std::endl;
  }
  return 0;
}

int CliHandler::handle_ask_command(const CliOptions &options) {
  docsage_core::IndexSnapshotStore store(resolve_index_path(options),
                                         docsage_core::IndexSnapshotStore::OpenMode::ExistingOnly);
  std::shared_ptr<const docsage_core::VectorIndex> index = store.load();

  Backends &models = backends();
  auto retriever = std::make_shared<docsage_core::Retriever>(index, models.embedder);
  docsage_core::AnswerService answer_service(retriever, models.generator);
  docsage_core::Answer answer = answer_service.answer(options.query, resolve_top_k(options));

  out_ << answer.text << std::endl;
  out_ << "\nSources:" << std::endl;
  for (size_t i = 0; i < answer.sources.size(); ++i) {
    const auto &source = answer.sources[i];
    out_ << "  [" << (i + 1) << "] chunk " << source.chunk.sequence_index << " (page "
         << (source.chunk.source_page_index + 1) << "): " << preview(source.chunk.content)
         << std::endl;
  }
  return 0;
}

int CliHandler::handle_chunk_command(const CliOptions &options) {
  docsage_core::DocumentLoaderFactory loaders;
  docsage_core::Document document = loaders.load(options.document_path);
  std::vector<docsage_core::Chunk> chunks = docsage_core::IndexBuilder::chunk_document(
      document, config_.chunk_size, config_.chunk_overlap);

  out_ << document.page_count() << " pages, " << chunks.size() << " chunks (size "
       << config_.chunk_size << ", overlap " << config_.chunk_overlap << ")" << std::endl;
  for (const auto &chunk : chunks) {
    out_ << "  #" << chunk.sequence_index << " page " << (chunk.source_page_index + 1) << " ["
         << chunk.start_offset << ", " << chunk.end_offset << ") " << preview(chunk.content)
         << std::endl;
  }
  return 0;
}

int CliHandler::handle_info_command(const CliOptions &options) {
  const std::string index_path = resolve_index_path(options);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(index_path, ec)) {
    out_ << "No index found at " << index_path << std::endl;
    return 1;
  }

  docsage_core::IndexSnapshotStore store(index_path,
                                         docsage_core::IndexSnapshotStore::OpenMode::ExistingOnly);
  std::optional<docsage_core::SnapshotInfo> info = store.read_info();
  if (!info) {
    out_ << "No index found at " << store.path().string() << std::endl;
    return 1;
  }

  out_ << "Index:           " << store.path().string() << std::endl;
  out_ << "Document:        " << info->document_source << std::endl;
  out_ << "Fingerprint:     " << info->document_fingerprint << std::endl;
  out_ << "Embedding model: " << info->embedding_model << std::endl;
  out_ << "Metric:          " << docsage_core::to_string(info->metric) << std::endl;
  out_ << "Dimension:       " << info->dimension << std::endl;
  out_ << "Chunks:          " << info->chunk_count << " (size " << info->chunk_size
       << ", overlap " << info->chunk_overlap << ")" << std::endl;
  out_ << "Created at:      "
       << docsage_core::IndexSnapshotStore::time_point_to_string(info->created_at) << " UTC"
       << std::endl;
  return 0;
}

void CliHandler::print_help(std::ostream &out) {
  out << R"(
docsage - question answering over a single document

Usage: docsage <command> [options]

Commands:
  build, b      Chunk, embed and index a document
                  --document, -d <path>   .txt (form-feed paged) or .md file
                  --index, -i <path>      snapshot file (default from config)
                  --force                 rebuild even if the snapshot is current
  query, q      Show the chunks nearest to a query
                  --query, -q <text>
                  --top-k, -k <n>
  ask, a        Answer a question from the indexed document
                  --query, -q <text>
                  --top-k, -k <n>
  chunk, c      Print chunk boundaries without embedding
                  --document, -d <path>
  info, i       Show snapshot metadata
                  --index, -i <path>
  help, h       Show this help

Every command accepts --config, -c <path>. Without it, ./docsagerc.json is
used when present, built-in defaults otherwise.
)";
}

}  // namespace docsage_cli
