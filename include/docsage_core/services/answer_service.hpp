#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docsage_core/llm/answer_generator.hpp"
#include "docsage_core/services/retriever.hpp"

namespace docsage_core {

struct Answer {
  std::string text;
  // The passages the answer was generated from, nearest first.
  std::vector<ScoredChunk> sources;
};

class AnswerService {
 public:
  AnswerService(std::shared_ptr<Retriever> retriever, std::shared_ptr<AnswerGenerator> generator);

  // Retrieves the top-k chunks and hands them to the generator.
  // An index with nothing relevant still reaches the generator with no context.
  Answer answer(const std::string &question, int k) const;

 private:
  std::shared_ptr<Retriever> retriever_;
  std::shared_ptr<AnswerGenerator> generator_;
};

}  // namespace docsage_core
