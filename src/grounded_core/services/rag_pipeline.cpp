#include "grounded_core/services/rag_pipeline.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

#include "grounded_core/errors.hpp"
#include "grounded_core/services/prompt_assembler.hpp"

namespace grounded_core {

std::string to_string(AskStatus status) {
  switch (status) {
    case AskStatus::Answered:
      return "answered";
    case AskStatus::NoAnswer:
      return "no_answer";
    case AskStatus::TemporarilyUnavailable:
      return "temporarily_unavailable";
  }
  throw std::invalid_argument("Unknown AskStatus");
}

PipelineOptions PipelineOptions::from_config(const Config &config) {
  PipelineOptions options;
  options.max_context_size = static_cast<size_t>(config.max_context_size);
  options.snippet_length = static_cast<size_t>(config.snippet_length);
  return options;
}

RagPipeline::RagPipeline(std::shared_ptr<const Retriever> retriever,
                         std::shared_ptr<const AnswerService> answer_service,
                         PipelineOptions options)
    : retriever_(std::move(retriever)),
      answer_service_(std::move(answer_service)),
      options_(options) {
  if (!retriever_ || !answer_service_) {
    throw std::invalid_argument("RagPipeline requires a retriever and an answer service");
  }
}

std::string RagPipeline::snippet(const std::string &text, size_t max_bytes) {
  auto end = text.begin();
  while (end != text.end()) {
    auto candidate = end;
    utf8::next(candidate, text.end());
    if (static_cast<size_t>(candidate - text.begin()) > max_bytes) {
      break;
    }
    end = candidate;
  }
  return std::string(text.begin(), end);
}

Citation RagPipeline::make_citation(const ScoredChunk &hit, size_t snippet_length) {
  Citation citation;
  citation.document_id = hit.chunk.document_id;
  citation.span = hit.chunk.span;
  citation.snippet = snippet(hit.chunk.text, snippet_length);
  citation.score = hit.score;
  citation.source = hit.chunk.source;
  return citation;
}

std::vector<Citation> RagPipeline::make_citations(const std::vector<ScoredChunk> &hits,
                                                  size_t snippet_length) {
  std::vector<Citation> citations;
  citations.reserve(hits.size());
  for (const auto &hit : hits) {
    citations.push_back(make_citation(hit, snippet_length));
  }
  return citations;
}

RetrievalResult RagPipeline::retrieve(const std::string &question, int k) const {
  if (k < 1) {
    throw std::invalid_argument("k must be at least 1, got " + std::to_string(k));
  }
  if (std::all_of(question.begin(), question.end(),
                  [](unsigned char c) { return std::isspace(c) != 0; })) {
    throw std::invalid_argument("Question cannot be empty");
  }
  return retriever_->retrieve(question, static_cast<size_t>(k), options_.max_context_size);
}

Answer RagPipeline::run(const std::string &question, int k) const {
  RetrievalResult context = retrieve(question, k);
  Prompt prompt = PromptAssembler::assemble(question, context);
  return answer_service_->answer(prompt, context);
}

AskResponse RagPipeline::ask(const std::string &question, int k) const {
  AskResponse response;
  try {
    Answer answer = run(question, k);
    response.status = answer.has_grounding() ? AskStatus::Answered : AskStatus::NoAnswer;
    response.answer = std::move(answer.text);
    response.citations = make_citations(answer.citations, options_.snippet_length);
  } catch (const CapabilityError &e) {
    std::cerr << "Warning: RagPipeline: " << e.what() << std::endl;
    response.status = AskStatus::TemporarilyUnavailable;
    response.answer = TEMPORARILY_UNAVAILABLE_ANSWER;
    response.error = e.what();
  }
  return response;
}

AskStream RagPipeline::ask_stream(const std::string &question, int k) const {
  AskStream result;
  RetrievalResult context;
  try {
    context = retrieve(question, k);
  } catch (const CapabilityError &e) {
    std::cerr << "Warning: RagPipeline: " << e.what() << std::endl;
    result.status = AskStatus::TemporarilyUnavailable;
    result.error = e.what();
    return result;
  }

  Prompt prompt = PromptAssembler::assemble(question, context);
  result.status = context.empty() ? AskStatus::NoAnswer : AskStatus::Answered;
  result.citations = make_citations(context.hits, options_.snippet_length);
  result.answer.emplace(answer_service_->stream(prompt, context));
  return result;
}

}  // namespace grounded_core
