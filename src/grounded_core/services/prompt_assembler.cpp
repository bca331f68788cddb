#include "grounded_core/services/prompt_assembler.hpp"

#include <sstream>

#include "grounded_core/types/answer.hpp"

namespace grounded_core {

std::string PromptAssembler::source_header(size_t number, const Chunk &chunk) {
  std::ostringstream header;
  header << "[Source " << number << "] complaint " << chunk.document_id << " | product "
         << (chunk.source.product.empty() ? "unknown" : chunk.source.product) << " | company "
         << (chunk.source.company.empty() ? "unknown" : chunk.source.company) << " | date "
         << (chunk.source.submission_date.empty() ? "unknown" : chunk.source.submission_date);
  return header.str();
}

Prompt PromptAssembler::assemble(const std::string &question, const RetrievalResult &context) {
  Prompt prompt;
  if (context.empty()) {
    prompt.requires_generation = false;
    prompt.fallback_answer = INSUFFICIENT_INFORMATION_ANSWER;
    return prompt;
  }

  std::ostringstream out;
  out << INSTRUCTION << "\n\nContext:\n";
  size_t number = 1;
  for (const auto &hit : context.hits) {
    out << "\n" << source_header(number++, hit.chunk) << "\n" << hit.chunk.text << "\n";
  }
  out << "\nQuestion: " << question << "\nAnswer:";

  prompt.text = out.str();
  prompt.context_chunks = context.size();
  return prompt;
}

}  // namespace grounded_core
