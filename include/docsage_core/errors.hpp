#pragma once

#include <cstddef>
#include <exception>
#include <string>

namespace docsage_core {

// Root of every error the pipeline raises. Third-party exceptions are wrapped
// into one of the subclasses below at the adapter that calls the library.
class DocsageError : public std::exception {
 public:
  explicit DocsageError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Bad chunk sizes, non-positive k, invalid configuration values.
class InvalidConfigurationError : public DocsageError {
 public:
  explicit InvalidConfigurationError(const std::string &message) : DocsageError(message) {}
};

// The embedding model could not be reached or returned a malformed vector.
// Transient failures (network, server busy) may be retried; malformed output may not.
class EmbeddingUnavailableError : public DocsageError {
 public:
  explicit EmbeddingUnavailableError(const std::string &message, bool transient = false)
      : DocsageError(message), transient_(transient) {}

  bool transient() const noexcept {
    return transient_;
  }

 private:
  bool transient_;
};

class DimensionMismatchError : public DocsageError {
 public:
  DimensionMismatchError(const std::string &context, size_t expected, size_t actual)
      : DocsageError(context + ": dimension mismatch. Expected " + std::to_string(expected) +
                     ", got " + std::to_string(actual)),
        expected_(expected),
        actual_(actual) {}

  size_t expected() const noexcept {
    return expected_;
  }
  size_t actual() const noexcept {
    return actual_;
  }

 private:
  size_t expected_;
  size_t actual_;
};

class TimeoutError : public DocsageError {
 public:
  explicit TimeoutError(const std::string &message) : DocsageError(message) {}
};

class DocumentLoadError : public DocsageError {
 public:
  explicit DocumentLoadError(const std::string &message) : DocsageError(message) {}
};

class CancelledError : public DocsageError {
 public:
  explicit CancelledError(const std::string &message) : DocsageError(message) {}
};

class GenerationError : public DocsageError {
 public:
  explicit GenerationError(const std::string &message) : DocsageError(message) {}
};

class VectorIndexError : public DocsageError {
 public:
  explicit VectorIndexError(const std::string &message) : DocsageError(message) {}
};

}  // namespace docsage_core
