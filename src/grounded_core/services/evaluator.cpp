#include "grounded_core/services/evaluator.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "grounded_core/async/worker_pool.hpp"
#include "grounded_core/errors.hpp"

namespace grounded_core {

namespace {

const std::unordered_set<std::string> &stop_words() {
  static const std::unordered_set<std::string> words = {
      "the",  "and",  "for",  "are",  "was",  "were", "that", "this", "with", "from", "have",
      "has",  "had",  "not",  "but",  "they", "their", "them", "you", "your", "our",  "can",
      "could", "would", "should", "been", "being", "which", "what", "when", "where", "who",
      "why",  "how",  "into", "about", "there", "these", "those", "some", "any", "all",
      "also", "its",  "his",  "her",  "she",  "him",  "than", "then", "did",  "does", "based",
      "excerpts", "complaint", "complaints", "source", "sources", "customer", "customers"};
  return words;
}

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// Lowercase ASCII alphanumeric tokens of three or more characters, minus stop words.
std::unordered_set<std::string> content_words(const std::string &text) {
  std::unordered_set<std::string> words;
  std::string current;
  auto flush = [&]() {
    if (current.size() >= 3 && stop_words().count(current) == 0) {
      words.insert(current);
    }
    current.clear();
  };
  for (unsigned char c : text) {
    if (std::isalnum(c)) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else {
      flush();
    }
  }
  flush();
  return words;
}

std::string markdown_cell(const std::string &text) {
  std::string cell;
  cell.reserve(text.size());
  for (char c : text) {
    if (c == '|') {
      cell += "\\|";
    } else if (c == '\n' || c == '\r') {
      cell += ' ';
    } else {
      cell += c;
    }
  }
  return cell;
}

std::string format_score(double score) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << score;
  return out.str();
}

}  // namespace

std::string to_string(EvaluationClass classification) {
  switch (classification) {
    case EvaluationClass::GroundedCorrect:
      return "grounded_correct";
    case EvaluationClass::GroundedIncomplete:
      return "grounded_incomplete";
    case EvaluationClass::Ungrounded:
      return "ungrounded";
    case EvaluationClass::Refused:
      return "refused";
    case EvaluationClass::Failed:
      return "failed";
  }
  throw std::invalid_argument("Unknown EvaluationClass");
}

EvaluatorOptions EvaluatorOptions::from_config(const Config &config) {
  EvaluatorOptions options;
  options.k = config.top_k;
  options.num_workers = static_cast<size_t>(config.num_workers);
  options.attribution_min_overlap = config.attribution_min_overlap;
  options.snippet_length = static_cast<size_t>(config.snippet_length);
  return options;
}

size_t EvaluationReport::count(EvaluationClass classification) const {
  return static_cast<size_t>(std::count_if(rows.begin(), rows.end(), [&](const EvaluationRow &row) {
    return row.classification == classification;
  }));
}

nlohmann::json EvaluationReport::to_json() const {
  nlohmann::json summary = {{"total", rows.size()}};
  for (auto classification :
       {EvaluationClass::GroundedCorrect, EvaluationClass::GroundedIncomplete,
        EvaluationClass::Ungrounded, EvaluationClass::Refused, EvaluationClass::Failed}) {
    summary[to_string(classification)] = count(classification);
  }

  nlohmann::json json_rows = nlohmann::json::array();
  for (const auto &row : rows) {
    nlohmann::json sources = nlohmann::json::array();
    for (const auto &citation : row.sources) {
      sources.push_back({{"document_id", citation.document_id},
                         {"span", {citation.span.start, citation.span.end}},
                         {"score", citation.score},
                         {"product", citation.source.product},
                         {"company", citation.source.company},
                         {"submission_date", citation.source.submission_date},
                         {"snippet", citation.snippet}});
    }
    nlohmann::json json_row = {{"question", row.question},
                               {"expected_topic", row.expected_topic},
                               {"answer", row.answer},
                               {"classification", to_string(row.classification)},
                               {"top_score", row.top_score},
                               {"attribution", row.attribution},
                               {"sources", sources}};
    if (!row.error.empty()) {
      json_row["error"] = row.error;
    }
    json_rows.push_back(std::move(json_row));
  }
  return {{"summary", summary}, {"rows", json_rows}};
}

std::string EvaluationReport::to_markdown() const {
  std::ostringstream out;
  out << "| # | Question | Answer | Sources | Top score | Classification |\n";
  out << "|---|---|---|---|---|---|\n";
  for (size_t i = 0; i < rows.size(); ++i) {
    const EvaluationRow &row = rows[i];
    std::string sources;
    for (const auto &citation : row.sources) {
      if (!sources.empty()) {
        sources += "; ";
      }
      sources += citation.document_id;
      if (!citation.source.product.empty()) {
        sources += " (" + citation.source.product + ")";
      }
    }
    std::string answer = row.error.empty() ? row.answer : "error: " + row.error;
    out << "| " << i + 1 << " | " << markdown_cell(row.question) << " | " << markdown_cell(answer)
        << " | " << markdown_cell(sources.empty() ? "-" : sources) << " | "
        << format_score(row.top_score) << " | " << to_string(row.classification) << " |\n";
  }
  out << "\n**Totals:** " << rows.size() << " questions";
  for (auto classification :
       {EvaluationClass::GroundedCorrect, EvaluationClass::GroundedIncomplete,
        EvaluationClass::Ungrounded, EvaluationClass::Refused, EvaluationClass::Failed}) {
    out << ", " << to_string(classification) << " " << count(classification);
  }
  out << "\n";
  return out.str();
}

Evaluator::Evaluator(std::shared_ptr<const RagPipeline> pipeline, EvaluatorOptions options)
    : pipeline_(std::move(pipeline)), options_(options) {
  if (!pipeline_) {
    throw std::invalid_argument("Evaluator requires a pipeline");
  }
  if (options_.k < 1) {
    throw ConfigurationError("Evaluation k must be at least 1");
  }
  if (options_.num_workers == 0) {
    throw ConfigurationError("Evaluation needs at least one worker");
  }
}

double Evaluator::attribution_overlap(const std::string &answer,
                                      const std::vector<ScoredChunk> &citations) {
  std::unordered_set<std::string> answer_words = content_words(answer);
  if (answer_words.empty()) {
    return 1.0;
  }
  std::unordered_set<std::string> context_words;
  for (const auto &citation : citations) {
    std::unordered_set<std::string> words = content_words(citation.chunk.text);
    context_words.insert(words.begin(), words.end());
  }
  size_t supported = 0;
  for (const auto &word : answer_words) {
    if (context_words.count(word) > 0) {
      ++supported;
    }
  }
  return static_cast<double>(supported) / static_cast<double>(answer_words.size());
}

bool Evaluator::matches_topic(const std::vector<ScoredChunk> &citations,
                              const std::string &expected_topic) {
  if (expected_topic.empty()) {
    return true;
  }
  const std::string topic = to_lower(expected_topic);
  for (const auto &citation : citations) {
    if (to_lower(citation.chunk.source.product) == topic ||
        to_lower(citation.chunk.text).find(topic) != std::string::npos) {
      return true;
    }
  }
  return false;
}

EvaluationClass Evaluator::classify(const Answer &answer,
                                    const std::string &expected_topic,
                                    double attribution_min_overlap) {
  if (answer.status != AnswerStatus::Grounded || answer.citations.empty()) {
    return EvaluationClass::Refused;
  }
  if (attribution_overlap(answer.text, answer.citations) < attribution_min_overlap) {
    return EvaluationClass::Ungrounded;
  }
  return matches_topic(answer.citations, expected_topic) ? EvaluationClass::GroundedCorrect
                                                         : EvaluationClass::GroundedIncomplete;
}

EvaluationRow Evaluator::evaluate_one(const EvaluationQuestion &question) const {
  EvaluationRow row;
  row.question = question.question;
  row.expected_topic = question.expected_topic;
  try {
    Answer answer = pipeline_->run(question.question, options_.k);
    row.answer = answer.text;
    row.sources = RagPipeline::make_citations(answer.citations, options_.snippet_length);
    for (const auto &citation : answer.citations) {
      row.top_score = std::max(row.top_score, citation.score);
    }
    row.attribution = answer.citations.empty() ? 0.0 : attribution_overlap(answer.text, answer.citations);
    row.classification = classify(answer, question.expected_topic, options_.attribution_min_overlap);
  } catch (const std::exception &e) {
    std::cerr << "Warning: Evaluator: question '" << question.question << "' failed: " << e.what()
              << std::endl;
    row.classification = EvaluationClass::Failed;
    row.error = e.what();
  }
  return row;
}

EvaluationReport Evaluator::evaluate(const std::vector<EvaluationQuestion> &questions) const {
  EvaluationReport report;
  if (questions.empty()) {
    return report;
  }

  async::WorkerPool pool(std::min(options_.num_workers, questions.size()));
  std::vector<std::future<EvaluationRow>> pending;
  pending.reserve(questions.size());
  for (const auto &question : questions) {
    pending.push_back(pool.submit([this, &question]() { return evaluate_one(question); }));
  }

  report.rows.reserve(questions.size());
  for (auto &future : pending) {
    report.rows.push_back(future.get());
  }
  std::cout << "Evaluator: graded " << report.rows.size() << " questions ("
            << report.count(EvaluationClass::GroundedCorrect) << " grounded_correct, "
            << report.count(EvaluationClass::Failed) << " failed)" << std::endl;
  return report;
}

std::vector<EvaluationQuestion> Evaluator::questions_from_json(const nlohmann::json &json) {
  const nlohmann::json &items = json.is_object() && json.contains("questions") ? json["questions"] : json;
  if (!items.is_array()) {
    throw DataError("Question set must be a JSON array or an object with a \"questions\" array");
  }

  std::vector<EvaluationQuestion> questions;
  for (const auto &item : items) {
    if (item.is_string()) {
      questions.push_back({item.get<std::string>(), ""});
      continue;
    }
    if (!item.is_object() || !item.contains("question") || !item["question"].is_string()) {
      throw DataError("Each question must be a string or an object with a \"question\" string");
    }
    EvaluationQuestion question;
    question.question = item["question"].get<std::string>();
    if (item.contains("expected_topic") && item["expected_topic"].is_string()) {
      question.expected_topic = item["expected_topic"].get<std::string>();
    }
    questions.push_back(std::move(question));
  }
  return questions;
}

std::vector<EvaluationQuestion> Evaluator::load_questions(const std::filesystem::path &path) {
  std::ifstream file_stream(path);
  if (!file_stream.is_open()) {
    throw DataError("Failed to open question set: " + path.string());
  }
  nlohmann::json json;
  try {
    file_stream >> json;
  } catch (const nlohmann::json::exception &e) {
    throw DataError("Failed to parse question set '" + path.string() + "': " + e.what());
  }
  return questions_from_json(json);
}

}  // namespace grounded_core
