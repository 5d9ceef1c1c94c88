#pragma once

#include <string>
#include <vector>

namespace docsage_core {

// A generative model that answers a question from supplied context passages.
class AnswerGenerator {
 public:
  virtual ~AnswerGenerator() = default;

  // One bounded attempt. Throws GenerationError or TimeoutError.
  virtual std::string generate_answer(const std::string &question,
                                      const std::vector<std::string> &context) = 0;
};

}  // namespace docsage_core
