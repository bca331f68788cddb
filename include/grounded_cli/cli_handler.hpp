#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "grounded_core/config.hpp"
#include "grounded_core/index/index_registry.hpp"
#include "grounded_core/llm/embedding_client.hpp"
#include "grounded_core/llm/generation_client.hpp"
#include "grounded_core/services/answer_service.hpp"
#include "grounded_core/services/rag_pipeline.hpp"

namespace grounded_cli
{

  enum class Command
  {
    Build,
    Ask,
    Evaluate,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string config_path = "groundedrc.json";
    std::string data_path;
    std::string question;
    int top_k = 0;  // 0 uses the configured top_k
    bool stream = true;
    std::string questions_path;
    std::string json_output_path;
    std::string markdown_output_path;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    CliHandler(grounded_core::Config config,
               std::shared_ptr<grounded_core::EmbeddingClient> embedding_client,
               std::shared_ptr<grounded_core::GenerationClient> generation_client);

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    static void print_help();

    // Prints increments until the stream ends or cancel_flag is set; the flag is checked
    // before every read. Returns true when the stream was cancelled. Throws CapabilityError.
    static bool stream_answer(grounded_core::AnswerStream &answer, const std::atomic<bool> &cancel_flag);

    // Loads the persisted index into the registry. Throws IndexCorruption or IncompatibleIndex.
    void load_index();

    const grounded_core::IndexRegistry &registry() const
    {
      return *registry_;
    }

  private:
    grounded_core::Config config_;
    std::shared_ptr<grounded_core::EmbeddingClient> embedding_client_;
    std::shared_ptr<grounded_core::GenerationClient> generation_client_;
    std::shared_ptr<grounded_core::IndexRegistry> registry_;

    // Command handlers
    void handle_build_command(const CliOptions &options);
    void handle_ask_command(const CliOptions &options);
    void handle_evaluate_command(const CliOptions &options);

    // Helper methods
    std::shared_ptr<const grounded_core::RagPipeline> make_pipeline() const;
    int resolve_top_k(const CliOptions &options) const;
    void print_response(const grounded_core::AskResponse &response);
    void print_citations(const std::vector<grounded_core::Citation> &citations);
    void write_file(const std::string &path, const std::string &contents);
  };

}  // namespace grounded_cli
