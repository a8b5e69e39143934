#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "command_backend.hpp"

namespace docqa_cli
{

  enum class Command
  {
    Ingest,
    Ask,
    Documents,
    Remove,
    Scan,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::vector<std::string> file_paths;
    std::string question;
    int top_k = 0;  // 0 means the configured default_top_k
    bool references = false;  // ask: print the Markdown references table instead of JSON
    std::string filename;
    std::string dir;
    std::string config_path = "docqarc.json";
    std::string api_base_url;
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
    // knowledge_dir and default_top_k come from the loaded configuration. Command results are
    // written to out as JSON.
    CliHandler(std::unique_ptr<CommandBackend> backend, std::string knowledge_dir,
               int default_top_k, std::ostream &out = std::cout);

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    CliHandler(CliHandler &&) noexcept = default;
    CliHandler &operator=(CliHandler &&) noexcept = default;

    // Parse command line arguments. --config and --api are accepted anywhere.
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command, printing JSON to stdout. Returns the process exit code.
    int execute_command(const CliOptions &options);

    static void print_help();

  private:
    std::unique_ptr<CommandBackend> backend_;
    std::string knowledge_dir_;
    int default_top_k_;
    std::ostream *out_;

    // Command handlers
    int handle_ingest_command(const CliOptions &options);
    int handle_ask_command(const CliOptions &options);
    int handle_documents_command(const CliOptions &options);
    int handle_remove_command(const CliOptions &options);
    int handle_scan_command(const CliOptions &options);

    // Helper methods
    void print_json_response(const nlohmann::json &response);
  };

}
