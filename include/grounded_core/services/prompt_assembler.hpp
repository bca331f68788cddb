#pragma once

#include <string>

#include "grounded_core/types/retrieval.hpp"

namespace grounded_core {

struct Prompt {
  std::string text;
  // False when there is no context; the generator must not be called.
  bool requires_generation = true;
  // The answer to give without generating, used when requires_generation is false.
  std::string fallback_answer;
  size_t context_chunks = 0;
};

// Renders the grounding instruction, the numbered context excerpts and the
// question. Output depends only on the inputs.
class PromptAssembler {
 public:
  static constexpr const char *INSTRUCTION =
      "You are a financial analyst assistant for CrediTrust.\n"
      "Your task is to answer questions about customer complaints.\n"
      "Use ONLY the following retrieved complaint excerpts to formulate your answer. "
      "Do not use any outside knowledge.\n"
      "If the excerpts do not contain the answer, state that you don't have enough information.";

  static Prompt assemble(const std::string &question, const RetrievalResult &context);

  // Header line naming a cited excerpt, 1-based.
  static std::string source_header(size_t number, const Chunk &chunk);
};

}  // namespace grounded_core
