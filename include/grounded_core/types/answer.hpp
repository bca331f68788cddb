#pragma once

#include <string>
#include <vector>

#include "grounded_core/types/retrieval.hpp"

namespace grounded_core {

inline constexpr const char *INSUFFICIENT_INFORMATION_ANSWER =
    "I don't have enough information from the retrieved complaints to answer this question.";

enum class AnswerStatus { Grounded, InsufficientInformation, Cancelled };

struct Answer {
  std::string text;
  // The chunks that were in the prompt context, in prompt order.
  std::vector<ScoredChunk> citations;
  AnswerStatus status = AnswerStatus::Grounded;

  bool has_grounding() const {
    return status == AnswerStatus::Grounded && !citations.empty();
  }
};

std::string to_string(AnswerStatus status);

}  // namespace grounded_core
