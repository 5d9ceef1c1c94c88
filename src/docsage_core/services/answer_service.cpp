#include "docsage_core/services/answer_service.hpp"

#include "docsage_core/errors.hpp"

namespace docsage_core {

AnswerService::AnswerService(std::shared_ptr<Retriever> retriever,
                             std::shared_ptr<AnswerGenerator> generator)
    : retriever_(std::move(retriever)), generator_(std::move(generator)) {
  if (!retriever_ || !generator_) {
    throw InvalidConfigurationError("AnswerService requires a retriever and a generator");
  }
}

Answer AnswerService::answer(const std::string &question, int k) const {
  std::vector<ScoredChunk> hits = retriever_->retrieve_scored(question, k);

  std::vector<std::string> context;
  context.reserve(hits.size());
  for (const auto &hit : hits) {
    context.push_back(hit.chunk.content);
  }

  Answer result;
  result.text = generator_->generate_answer(question, context);
  result.sources = std::move(hits);
  return result;
}

}  // namespace docsage_core
