#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "grounded_core/config.hpp"
#include "grounded_core/services/rag_pipeline.hpp"

namespace grounded_core {

struct EvaluationQuestion {
  std::string question;
  // Product name or phrase the cited complaints should be about. Empty skips the topic check.
  std::string expected_topic;
};

enum class EvaluationClass { GroundedCorrect, GroundedIncomplete, Ungrounded, Refused, Failed };

std::string to_string(EvaluationClass classification);

struct EvaluationRow {
  std::string question;
  std::string expected_topic;
  std::string answer;
  std::vector<Citation> sources;
  float top_score = 0.0f;
  double attribution = 0.0;
  EvaluationClass classification = EvaluationClass::Failed;
  std::string error;
};

struct EvaluationReport {
  std::vector<EvaluationRow> rows;  // in question order

  size_t count(EvaluationClass classification) const;
  nlohmann::json to_json() const;
  std::string to_markdown() const;
};

struct EvaluatorOptions {
  int k = 5;
  size_t num_workers = 4;
  double attribution_min_overlap = 0.5;
  size_t snippet_length = 200;

  static EvaluatorOptions from_config(const Config &config);
};

/**
 * @class Evaluator
 * @brief Runs a question set through the pipeline and grades the answers.
 *
 * Questions run concurrently on a bounded worker pool. A question that throws
 * is recorded as Failed with its error and the batch carries on.
 */
class Evaluator {
 public:
  Evaluator(std::shared_ptr<const RagPipeline> pipeline, EvaluatorOptions options = {});

  EvaluationReport evaluate(const std::vector<EvaluationQuestion> &questions) const;

  EvaluationRow evaluate_one(const EvaluationQuestion &question) const;

  /**
   * @brief Reads a question set: a JSON array of {"question", "expected_topic"}
   * objects, or an object holding such an array under "questions".
   * @throws DataError if the file cannot be read or has the wrong shape.
   */
  static std::vector<EvaluationQuestion> load_questions(const std::filesystem::path &path);
  static std::vector<EvaluationQuestion> questions_from_json(const nlohmann::json &json);

  // Fraction of the answer's distinct content words found in the cited chunk texts.
  static double attribution_overlap(const std::string &answer, const std::vector<ScoredChunk> &citations);

  static bool matches_topic(const std::vector<ScoredChunk> &citations, const std::string &expected_topic);

  static EvaluationClass classify(const Answer &answer,
                                  const std::string &expected_topic,
                                  double attribution_min_overlap);

 private:
  std::shared_ptr<const RagPipeline> pipeline_;
  EvaluatorOptions options_;
};

}  // namespace grounded_core
