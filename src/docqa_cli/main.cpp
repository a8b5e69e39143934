#include "docqa_cli/cli_handler.hpp"
#include "docqa_cli/command_backend.hpp"
#include "docqa_core/config.hpp"
#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/service_provider.hpp"
#include <curl/curl.h>
#include <cstdlib>
#include <iostream>
#include <memory>

int main(int argc, char *argv[])
{
  docqa_cli::CliOptions options;
  try
  {
    options = docqa_cli::CliHandler::parse_arguments(argc, argv);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  if (options.command == docqa_cli::Command::Help)
  {
    docqa_cli::CliHandler::print_help();
    return 0;
  }

  // Command results go to stdout; service progress logging is sent to stderr
  std::ostream json_out(std::cout.rdbuf());
  std::streambuf *stdout_buf = std::cout.rdbuf(std::cerr.rdbuf());

  curl_global_init(CURL_GLOBAL_DEFAULT);
  int exit_code = 0;
  try
  {
    docqa_core::Config config = docqa_core::Config::from_file_or_defaults(options.config_path);

    // Get API base URL from the command line or the environment
    std::string api_base_url = options.api_base_url;
    if (api_base_url.empty())
    {
      const char *env_url = std::getenv("DOCQA_API_URL");
      api_base_url = env_url ? env_url : "";
    }

    std::unique_ptr<docqa_cli::CommandBackend> backend;
    if (!api_base_url.empty())
    {
      backend = std::make_unique<docqa_cli::HttpBackend>(api_base_url);
    }
    else
    {
      backend = std::make_unique<docqa_cli::LocalBackend>(
          docqa_core::ServiceProvider::from_config(config));
    }

    docqa_cli::CliHandler handler(std::move(backend), config.knowledge_dir,
                                  config.default_top_k, json_out);
    exit_code = handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }

  docqa_core::DatabaseManager::get_instance().shutdown();
  curl_global_cleanup();
  std::cout.rdbuf(stdout_buf);
  return exit_code;
}
