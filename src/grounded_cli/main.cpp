#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>

#include "grounded_cli/cli_handler.hpp"
#include "grounded_core/config.hpp"
#include "grounded_core/errors.hpp"
#include "grounded_core/llm/embedding_client.hpp"
#include "grounded_core/llm/ollama_client.hpp"

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    grounded_cli::CliOptions options = grounded_cli::CliHandler::parse_arguments(argc, argv);
    if (options.command == grounded_cli::Command::Help) {
      grounded_cli::CliHandler::print_help();
      return 0;
    }

    // An explicit --config wins over the environment
    const char *env_config = std::getenv("GROUNDED_CONFIG");
    if (env_config && options.config_path == grounded_cli::CliOptions().config_path) {
      options.config_path = env_config;
    }
    grounded_core::Config config = grounded_core::Config::from_file(options.config_path);

    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Generation Model: " << config.generation_model << std::endl;
    std::cout << "Index Path: " << config.index_path << std::endl;

    auto ollama_client = std::make_shared<grounded_core::OllamaClient>(
        config.ollama_url, config.embedding_model, config.generation_model,
        std::chrono::milliseconds(config.generation_timeout_ms));
    grounded_core::verify_embedding_dimension(*ollama_client,
                                              static_cast<size_t>(config.embedding_dimension));

    grounded_cli::CliHandler handler(config, ollama_client, ollama_client);
    handler.execute_command(options);
  } catch (const grounded_core::IndexCorruption &e) {
    std::cerr << "Error: index is unusable, rebuild it with 'grounded build': " << e.what()
              << std::endl;
    return 2;
  } catch (const grounded_core::ConfigurationError &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
