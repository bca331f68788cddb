#include <gtest/gtest.h>

#include "grounded_core/services/prompt_assembler.hpp"
#include "grounded_core/types/answer.hpp"
#include "utilities_test.hpp"

namespace grounded_tests {

using namespace grounded_core;

class PromptAssemblerTest : public ::testing::Test {
 protected:
  RetrievalResult two_hit_context() const {
    RetrievalResult context;
    Chunk fee = TestUtilities::make_chunk("c-101", 0, "Charged a late fee twice.", 0, "v1", "Credit card");
    fee.source.company = "Acme Bank";
    fee.source.submission_date = "2023-01-15";
    Chunk transfer = TestUtilities::make_chunk("c-202", 3, "Wire transfer delayed.", 120);
    context.hits.push_back({fee, 0.91f});
    context.hits.push_back({transfer, 0.52f});
    return context;
  }
};

TEST_F(PromptAssemblerTest, EmptyContextRequiresNoGeneration) {
  Prompt prompt = PromptAssembler::assemble("Why was I charged?", RetrievalResult{});

  EXPECT_FALSE(prompt.requires_generation);
  EXPECT_EQ(prompt.fallback_answer, INSUFFICIENT_INFORMATION_ANSWER);
  EXPECT_EQ(prompt.context_chunks, 0u);
  EXPECT_TRUE(prompt.text.empty());
}

TEST_F(PromptAssemblerTest, RendersInstructionSourcesAndQuestionInOrder) {
  Prompt prompt = PromptAssembler::assemble("Why was I charged?", two_hit_context());

  ASSERT_TRUE(prompt.requires_generation);
  EXPECT_EQ(prompt.context_chunks, 2u);
  EXPECT_EQ(prompt.text.rfind(PromptAssembler::INSTRUCTION, 0), 0u);

  const size_t first = prompt.text.find(
      "[Source 1] complaint c-101 | product Credit card | company Acme Bank | date 2023-01-15\n"
      "Charged a late fee twice.\n");
  const size_t second = prompt.text.find(
      "[Source 2] complaint c-202 | product unknown | company unknown | date unknown\n"
      "Wire transfer delayed.\n");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(first, second);

  const std::string ending = "\nQuestion: Why was I charged?\nAnswer:";
  ASSERT_GE(prompt.text.size(), ending.size());
  EXPECT_EQ(prompt.text.substr(prompt.text.size() - ending.size()), ending);
}

TEST_F(PromptAssemblerTest, OutputDependsOnlyOnInputs) {
  EXPECT_EQ(PromptAssembler::assemble("q", two_hit_context()).text,
            PromptAssembler::assemble("q", two_hit_context()).text);
}

TEST_F(PromptAssemblerTest, InstructionForbidsOutsideKnowledge) {
  const std::string instruction = PromptAssembler::INSTRUCTION;
  EXPECT_NE(instruction.find("Use ONLY"), std::string::npos);
  EXPECT_NE(instruction.find("don't have enough information"), std::string::npos);
}

}  // namespace grounded_tests
