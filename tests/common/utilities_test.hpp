#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "docsage_core/types/chunk.hpp"

namespace docsage_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Unique path under the system temp directory; nothing is created.
  static std::filesystem::path create_temp_path(const std::string &extension);
  static void cleanup_temp_file(const std::filesystem::path &path);
  static void write_file(const std::filesystem::path &path, const std::string &content);

  // Deterministic vector derived from seed_text.
  static std::vector<float> create_test_vector(const std::string &seed_text, int dimension = 8);

  // `length` bytes of `pattern` repeated.
  static std::string repeat_to_length(const std::string &pattern, size_t length);

  // Entries whose chunk i has content "chunk i" and vector create_test_vector("chunk i").
  static std::vector<docsage_core::IndexEntry> create_test_entries(int count, int dimension = 8);
};

// Fixture base that hands out a temp file path and removes it afterwards.
class TempFileTestBase : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const auto &path : temp_paths_) {
      TestUtilities::cleanup_temp_file(path);
    }
  }

  std::filesystem::path temp_path(const std::string &extension) {
    temp_paths_.push_back(TestUtilities::create_temp_path(extension));
    return temp_paths_.back();
  }

 private:
  std::vector<std::filesystem::path> temp_paths_;
};

}  // namespace docsage_tests
