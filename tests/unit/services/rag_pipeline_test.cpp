#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "grounded_core/errors.hpp"
#include "grounded_core/services/rag_pipeline.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

namespace grounded_tests {

using namespace grounded_core;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

class RagPipelineTest : public ScenarioIndexTestBase {
 protected:
  void SetUp() override {
    ScenarioIndexTestBase::SetUp();
    generator_ = std::make_shared<NiceMock<MockGenerationClient>>();
  }

  std::shared_ptr<RagPipeline> make_pipeline(std::shared_ptr<EmbeddingClient> embedder = nullptr) {
    RetrieverOptions retriever_options;
    retriever_options.retry.max_retries = 0;
    AnswerServiceOptions answer_options;
    answer_options.retry.max_retries = 0;
    answer_options.generation_timeout = std::chrono::milliseconds(500);

    auto retriever = std::make_shared<Retriever>(embedder ? embedder : embedder_, registry_,
                                                 retriever_options);
    auto answer_service = std::make_shared<AnswerService>(generator_, answer_options);
    PipelineOptions options;
    options.snippet_length = 40;
    return std::make_shared<RagPipeline>(retriever, answer_service, options);
  }

  std::shared_ptr<NiceMock<MockGenerationClient>> generator_;
};

TEST_F(RagPipelineTest, AnswersFromTheRelevantComplaint) {
  EXPECT_CALL(*generator_, generate(HasSubstr("complaint late-fee")))
      .WillOnce(Return("A late fee was charged twice."));
  auto pipeline = make_pipeline();

  AskResponse response = pipeline->ask("Why was I charged a fee?", 2);

  EXPECT_EQ(response.status, AskStatus::Answered);
  EXPECT_EQ(response.answer, "A late fee was charged twice.");
  ASSERT_EQ(response.citations.size(), 1u);
  const Citation &citation = response.citations[0];
  EXPECT_EQ(citation.document_id, "late-fee");
  EXPECT_EQ(citation.source.product, "Credit card");
  EXPECT_LE(citation.snippet.size(), 40u);
  EXPECT_EQ(citation.snippet, "I was charged a late fee even though my ");
  EXPECT_GT(citation.score, 0.3f);
}

TEST_F(RagPipelineTest, UnrelatedQuestionGetsNoAnswerWithoutGenerating) {
  EXPECT_CALL(*generator_, generate(_)).Times(0);
  EXPECT_CALL(*generator_, generate_stream(_)).Times(0);
  auto pipeline = make_pipeline();

  AskResponse response = pipeline->ask("What is the weather in Paris?", 5);

  EXPECT_EQ(response.status, AskStatus::NoAnswer);
  EXPECT_EQ(response.answer, INSUFFICIENT_INFORMATION_ANSWER);
  EXPECT_TRUE(response.citations.empty());
}

TEST_F(RagPipelineTest, RejectsInvalidRequests) {
  auto pipeline = make_pipeline();
  EXPECT_THROW(pipeline->ask("Why was I charged a fee?", 0), std::invalid_argument);
  EXPECT_THROW(pipeline->ask("Why was I charged a fee?", -3), std::invalid_argument);
  EXPECT_THROW(pipeline->ask("   \n", 5), std::invalid_argument);
  EXPECT_THROW(pipeline->ask_stream("", 5), std::invalid_argument);
}

TEST_F(RagPipelineTest, GenerationOutageIsTemporarilyUnavailable) {
  EXPECT_CALL(*generator_, generate(_)).WillOnce([](const std::string &) -> std::string {
    throw GenerationUnavailable("connection refused");
  });
  auto pipeline = make_pipeline();

  AskResponse response = pipeline->ask("Why was I charged a fee?", 2);
  EXPECT_EQ(response.status, AskStatus::TemporarilyUnavailable);
  EXPECT_EQ(response.answer, TEMPORARILY_UNAVAILABLE_ANSWER);
  EXPECT_THAT(response.error, HasSubstr("connection refused"));
  EXPECT_TRUE(response.citations.empty());
}

TEST_F(RagPipelineTest, EmbeddingOutageIsNotReportedAsNoResults) {
  auto broken = std::make_shared<NiceMock<MockEmbeddingClient>>();
  ON_CALL(*broken, get_embedding(_)).WillByDefault([](const std::string &) -> std::vector<float> {
    throw EmbeddingUnavailable("model not loaded");
  });
  auto pipeline = make_pipeline(broken);

  EXPECT_EQ(pipeline->ask("Why was I charged a fee?", 2).status, AskStatus::TemporarilyUnavailable);

  AskStream stream = pipeline->ask_stream("Why was I charged a fee?", 2);
  EXPECT_EQ(stream.status, AskStatus::TemporarilyUnavailable);
  EXPECT_FALSE(stream.answer.has_value());
  EXPECT_THAT(stream.error, HasSubstr("model not loaded"));
}

TEST_F(RagPipelineTest, MissingIndexPropagates) {
  registry_->teardown();
  auto pipeline = make_pipeline();
  EXPECT_THROW(pipeline->ask("Why was I charged a fee?", 2), IndexUnavailable);
}

TEST_F(RagPipelineTest, StreamCarriesCitationsBeforeTheText) {
  EXPECT_CALL(*generator_, generate_stream(_)).WillOnce([](const std::string &) {
    return std::unique_ptr<TextStream>(
        std::make_unique<ScriptedTextStream>(std::vector<std::string>{"Late ", "fee."}));
  });
  auto pipeline = make_pipeline();

  AskStream stream = pipeline->ask_stream("Why was I charged a fee?", 2);
  ASSERT_EQ(stream.status, AskStatus::Answered);
  ASSERT_EQ(stream.citations.size(), 1u);
  EXPECT_EQ(stream.citations[0].document_id, "late-fee");
  ASSERT_TRUE(stream.answer.has_value());

  std::string text;
  while (auto increment = stream.answer->next()) {
    text += *increment;
  }
  EXPECT_EQ(text, "Late fee.");
}

TEST_F(RagPipelineTest, StreamWithoutContextYieldsTheFallback) {
  EXPECT_CALL(*generator_, generate_stream(_)).Times(0);
  auto pipeline = make_pipeline();

  AskStream stream = pipeline->ask_stream("What is the weather in Paris?", 3);
  EXPECT_EQ(stream.status, AskStatus::NoAnswer);
  EXPECT_TRUE(stream.citations.empty());
  ASSERT_TRUE(stream.answer.has_value());
  Answer answer = stream.answer->finish();
  EXPECT_EQ(answer.text, INSUFFICIENT_INFORMATION_ANSWER);
  EXPECT_EQ(answer.status, AnswerStatus::InsufficientInformation);
}

TEST_F(RagPipelineTest, RunReturnsCitedChunks) {
  ON_CALL(*generator_, generate(_)).WillByDefault(Return("Unauthorized card purchases."));
  auto pipeline = make_pipeline();

  Answer answer = pipeline->run("Was there fraud on my card?", 3);
  EXPECT_EQ(answer.status, AnswerStatus::Grounded);
  ASSERT_EQ(answer.citations.size(), 1u);
  EXPECT_EQ(answer.citations[0].chunk.document_id, "card-fraud");
}

TEST(RagPipelineSnippetTest, CutsOnCodePointBoundaries) {
  const std::string text = "fee \xE2\x82\xAC" "20";  // "fee €20"
  EXPECT_EQ(RagPipeline::snippet(text, 4), "fee ");
  EXPECT_EQ(RagPipeline::snippet(text, 5), "fee ");
  EXPECT_EQ(RagPipeline::snippet(text, 6), "fee ");
  EXPECT_EQ(RagPipeline::snippet(text, 7), "fee \xE2\x82\xAC");
  EXPECT_EQ(RagPipeline::snippet(text, 100), text);
  EXPECT_EQ(RagPipeline::snippet(text, 0), "");
}

TEST(RagPipelineStatusTest, StatusNames) {
  EXPECT_EQ(to_string(AskStatus::Answered), "answered");
  EXPECT_EQ(to_string(AskStatus::NoAnswer), "no_answer");
  EXPECT_EQ(to_string(AskStatus::TemporarilyUnavailable), "temporarily_unavailable");
}

}  // namespace grounded_tests
