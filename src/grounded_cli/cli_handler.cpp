#include "grounded_cli/cli_handler.hpp"

#include <atomic>
#include <csignal>
#include <fstream>
#include <iomanip>  // Required for std::fixed and std::setprecision
#include <iostream>
#include <stdexcept>

#include "grounded_core/errors.hpp"
#include "grounded_core/index/index_builder.hpp"
#include "grounded_core/index/vector_index.hpp"
#include "grounded_core/ingest/document_loader.hpp"
#include "grounded_core/services/answer_service.hpp"
#include "grounded_core/services/evaluator.hpp"
#include "grounded_core/services/retriever.hpp"

namespace grounded_cli {

namespace {

std::atomic<bool> cancel_requested{false};

void interrupt_handler(int) {
    cancel_requested.store(true);
}

// Routes SIGINT to the cancel flag for the guard's lifetime.
class SigintGuard {
public:
    SigintGuard() {
        cancel_requested.store(false);
        previous_ = std::signal(SIGINT, interrupt_handler);
    }

    ~SigintGuard() {
        if (previous_ != SIG_ERR) {
            std::signal(SIGINT, previous_);
        }
    }

    SigintGuard(const SigintGuard&) = delete;
    SigintGuard& operator=(const SigintGuard&) = delete;

private:
    void (*previous_)(int) = SIG_ERR;
};

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw CliError("Invalid value for " + flag + ": " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw CliError("Invalid value for " + flag + ": " + value);
    }
}

}  // namespace

CliHandler::CliHandler(grounded_core::Config config,
                       std::shared_ptr<grounded_core::EmbeddingClient> embedding_client,
                       std::shared_ptr<grounded_core::GenerationClient> generation_client)
    : config_(std::move(config)),
      embedding_client_(std::move(embedding_client)),
      generation_client_(std::move(generation_client)),
      registry_(std::make_shared<grounded_core::IndexRegistry>()) {
    if (!embedding_client_ || !generation_client_) {
        throw CliError("CliHandler requires embedding and generation clients");
    }
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];
    if (command == "build" || command == "b") {
        options.command = Command::Build;
    } else if (command == "ask" || command == "a") {
        options.command = Command::Ask;
    } else if (command == "evaluate" || command == "eval" || command == "e") {
        options.command = Command::Evaluate;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else {
        throw CliError("Unknown command: " + command);
    }

    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--no-stream") {
            options.stream = false;
            continue;
        }
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[++i];

        if (flag == "--config" || flag == "-c") {
            options.config_path = value;
        } else if (flag == "--data" || flag == "-d") {
            options.data_path = value;
        } else if (flag == "--question" || flag == "-q") {
            options.question = value;
        } else if (flag == "--top-k" || flag == "-k") {
            options.top_k = parse_int(flag, value);
            if (options.top_k < 1) {
                throw CliError("--top-k must be at least 1");
            }
        } else if (flag == "--questions") {
            options.questions_path = value;
        } else if (flag == "--json") {
            options.json_output_path = value;
        } else if (flag == "--markdown") {
            options.markdown_output_path = value;
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }

    if (options.command == Command::Build && options.data_path.empty()) {
        throw CliError("Build command requires a data file. Usage: build --data <complaints.jsonl>");
    }
    if (options.command == Command::Ask && options.question.empty()) {
        throw CliError("Ask command requires a question. Usage: ask --question <text>");
    }
    if (options.command == Command::Evaluate && options.questions_path.empty()) {
        throw CliError("Evaluate command requires a question set. Usage: evaluate --questions <file.json>");
    }
    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Build:
            handle_build_command(options);
            break;
        case Command::Ask:
            handle_ask_command(options);
            break;
        case Command::Evaluate:
            handle_evaluate_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::load_index() {
    grounded_core::IndexExpectations expectations;
    expectations.dimension = static_cast<size_t>(config_.embedding_dimension);
    expectations.metric = config_.distance_metric;
    expectations.corpus_version = config_.corpus_version();

    std::cout << "Loading index from " << config_.index_path << "..." << std::endl;
    auto index = grounded_core::VectorIndex::load(config_.index_path, expectations);
    registry_->publish(index);
    std::cout << "Index loaded: " << index->size() << " vectors, corpus version "
              << index->corpus_version() << std::endl;
}

std::shared_ptr<const grounded_core::RagPipeline> CliHandler::make_pipeline() const {
    auto retriever = std::make_shared<grounded_core::Retriever>(
        embedding_client_, registry_, grounded_core::RetrieverOptions::from_config(config_));
    auto answer_service = std::make_shared<grounded_core::AnswerService>(
        generation_client_, grounded_core::AnswerServiceOptions::from_config(config_));
    return std::make_shared<grounded_core::RagPipeline>(
        retriever, answer_service, grounded_core::PipelineOptions::from_config(config_));
}

int CliHandler::resolve_top_k(const CliOptions& options) const {
    return options.top_k > 0 ? options.top_k : config_.top_k;
}

void CliHandler::handle_build_command(const CliOptions& options) {
    std::vector<grounded_core::Document> documents =
        grounded_core::DocumentLoader::load_jsonl(options.data_path);

    grounded_core::IndexBuilder builder(*embedding_client_,
                                        grounded_core::IndexBuildOptions::from_config(config_));
    auto index = builder.build(documents, [](float progress, const std::string& message) {
        std::cout << "[" << std::setw(3) << static_cast<int>(progress * 100.0f) << "%] " << message
                  << std::endl;
    });

    index->persist(config_.index_path);
    registry_->publish(index);
    std::cout << "Build complete: " << documents.size() << " documents, " << index->size()
              << " chunks indexed (" << grounded_core::to_string(index->kind()) << ")." << std::endl;
}

void CliHandler::handle_ask_command(const CliOptions& options) {
    load_index();
    auto pipeline = make_pipeline();
    const int k = resolve_top_k(options);

    if (!options.stream) {
        print_response(pipeline->ask(options.question, k));
        return;
    }

    grounded_core::AskStream result = pipeline->ask_stream(options.question, k);
    if (result.status == grounded_core::AskStatus::TemporarilyUnavailable) {
        std::cout << grounded_core::TEMPORARILY_UNAVAILABLE_ANSWER << std::endl;
        std::cerr << "Error: " << result.error << std::endl;
        return;
    }

    std::cout << "\nAnswer:\n";
    {
        SigintGuard guard;
        try {
            stream_answer(*result.answer, cancel_requested);
        } catch (const grounded_core::CapabilityError& e) {
            std::cout << "\n" << grounded_core::TEMPORARILY_UNAVAILABLE_ANSWER << std::endl;
            std::cerr << "Error: " << e.what() << std::endl;
            return;
        }
    }
    std::cout << std::endl;

    grounded_core::Answer answer = result.answer->finish();
    if (answer.status == grounded_core::AnswerStatus::Cancelled) {
        return;
    }
    print_citations(result.citations);
}

bool CliHandler::stream_answer(grounded_core::AnswerStream& answer,
                               const std::atomic<bool>& cancel_flag) {
    while (!cancel_flag.load()) {
        auto increment = answer.next();
        if (!increment) {
            return false;
        }
        std::cout << *increment << std::flush;
    }
    answer.cancel();
    std::cout << "\n[cancelled]" << std::endl;
    return true;
}

void CliHandler::handle_evaluate_command(const CliOptions& options) {
    load_index();
    std::vector<grounded_core::EvaluationQuestion> questions =
        grounded_core::Evaluator::load_questions(options.questions_path);
    std::cout << "Evaluating " << questions.size() << " questions..." << std::endl;

    grounded_core::EvaluatorOptions evaluator_options =
        grounded_core::EvaluatorOptions::from_config(config_);
    evaluator_options.k = resolve_top_k(options);
    grounded_core::Evaluator evaluator(make_pipeline(), evaluator_options);
    grounded_core::EvaluationReport report = evaluator.evaluate(questions);

    std::string markdown = report.to_markdown();
    std::cout << "\n" << markdown << std::endl;
    if (!options.json_output_path.empty()) {
        write_file(options.json_output_path, report.to_json().dump(2));
        std::cout << "JSON report written to " << options.json_output_path << std::endl;
    }
    if (!options.markdown_output_path.empty()) {
        write_file(options.markdown_output_path, markdown);
        std::cout << "Markdown report written to " << options.markdown_output_path << std::endl;
    }
}

void CliHandler::print_response(const grounded_core::AskResponse& response) {
    std::cout << "\nStatus: " << grounded_core::to_string(response.status) << std::endl;
    std::cout << "\nAnswer:\n" << response.answer << std::endl;
    if (!response.error.empty()) {
        std::cerr << "Error: " << response.error << std::endl;
    }
    print_citations(response.citations);
}

void CliHandler::print_citations(const std::vector<grounded_core::Citation>& citations) {
    if (citations.empty()) {
        return;
    }
    std::cout << "\nSources:" << std::endl;
    size_t number = 1;
    for (const auto& citation : citations) {
        std::cout << "  [" << number++ << "] complaint " << citation.document_id << " ("
                  << (citation.source.product.empty() ? "unknown product" : citation.source.product)
                  << ") bytes " << citation.span.start << "-" << citation.span.end
                  << " | Score: " << std::fixed << std::setprecision(3) << citation.score << std::endl;
        std::cout << "      " << citation.snippet;
        if (citation.snippet.size() < citation.span.length()) {
            std::cout << "...";
        }
        std::cout << std::endl;
    }
}

void CliHandler::write_file(const std::string& path, const std::string& contents) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw CliError("Failed to open output file: " + path);
    }
    out << contents;
    if (!out) {
        throw CliError("Failed to write output file: " + path);
    }
}

void CliHandler::print_help() {
    std::cout << "Grounded RAG - answers questions about consumer complaints from retrieved evidence\n\n";
    std::cout << "Usage: grounded <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  build, b       Chunk, embed and index a JSON Lines complaint file\n";
    std::cout << "                 --data, -d <path>     Cleaned complaints (.jsonl)\n";
    std::cout << "  ask, a         Answer a question from the indexed complaints\n";
    std::cout << "                 --question, -q <text> The question\n";
    std::cout << "                 --top-k, -k <n>       Chunks to retrieve (default: top_k from config)\n";
    std::cout << "                 --no-stream           Print the answer once it is complete\n";
    std::cout << "  evaluate, e    Run a question set and grade the answers\n";
    std::cout << "                 --questions <path>    JSON question set\n";
    std::cout << "                 --json <path>         Write the report as JSON\n";
    std::cout << "                 --markdown <path>     Write the report as a Markdown table\n";
    std::cout << "  help, h        Show this help message\n\n";
    std::cout << "Global options:\n";
    std::cout << "  --config, -c <path>  Configuration file (default: groundedrc.json)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  grounded build --data data/filtered_complaints.jsonl\n";
    std::cout << "  grounded ask --question \"Why are people unhappy with credit card fees?\" -k 5\n";
    std::cout << "  grounded evaluate --questions eval/questions.json --markdown eval/report.md\n";
}

}  // namespace grounded_cli
