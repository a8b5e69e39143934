#include "docqa_cli/cli_handler.hpp"
#include <iostream>
#include <stdexcept>

namespace docqa_cli {

CliHandler::CliHandler(std::unique_ptr<CommandBackend> backend, std::string knowledge_dir,
                       int default_top_k, std::ostream& out)
    : backend_(std::move(backend)),
      knowledge_dir_(std::move(knowledge_dir)),
      default_top_k_(default_top_k),
      out_(&out) {
    if (!backend_) {
        throw CliError("CliHandler requires a command backend");
    }
}

namespace {

int parse_top_k(const std::string& value) {
    int top_k = 0;
    try {
        size_t consumed = 0;
        top_k = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw CliError("--top-k must be an integer, got '" + value + "'");
        }
    } catch (const std::invalid_argument&) {
        throw CliError("--top-k must be an integer, got '" + value + "'");
    } catch (const std::out_of_range&) {
        throw CliError("--top-k is out of range: " + value);
    }
    if (top_k <= 0) {
        throw CliError("--top-k must be greater than 0");
    }
    return top_k;
}

}  // namespace

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    // Global options first; whatever is left is the command and its flag/value pairs
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--api") {
            if (i + 1 >= argc) {
                throw CliError(arg + " requires a value");
            }
            if (arg == "--config") {
                options.config_path = argv[++i];
            } else {
                options.api_base_url = argv[++i];
            }
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        options.command = Command::Help;
        return options;
    }

    std::string command = args[0];
    if (command == "ingest" || command == "i") {
        options.command = Command::Ingest;
    } else if (command == "ask" || command == "a") {
        options.command = Command::Ask;
    } else if (command == "documents" || command == "ls") {
        options.command = Command::Documents;
    } else if (command == "remove" || command == "rm") {
        options.command = Command::Remove;
    } else if (command == "scan") {
        options.command = Command::Scan;
    } else if (command == "help" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else {
        throw CliError("Unknown command: " + command + ". Run 'docqa_cli help' for usage.");
    }

    for (size_t i = 1; i < args.size(); i += 2) {
        const std::string& flag = args[i];
        if (options.command == Command::Ask && flag == "--references") {
            options.references = true;
            --i;
            continue;
        }
        if (i + 1 >= args.size()) {
            throw CliError("Missing value for " + flag);
        }
        const std::string& value = args[i + 1];

        if (options.command == Command::Ingest && (flag == "--file" || flag == "-f")) {
            options.file_paths.push_back(value);
        } else if (options.command == Command::Ask && (flag == "--question" || flag == "-q")) {
            options.question = value;
        } else if (options.command == Command::Ask && (flag == "--top-k" || flag == "-k")) {
            options.top_k = parse_top_k(value);
        } else if (options.command == Command::Remove && (flag == "--filename" || flag == "-n")) {
            options.filename = value;
        } else if (options.command == Command::Scan && (flag == "--dir" || flag == "-d")) {
            options.dir = value;
        } else {
            throw CliError("Unknown option for " + command + ": " + flag);
        }
    }

    if (options.command == Command::Ingest && options.file_paths.empty()) {
        throw CliError("Ingest command requires at least one file. Usage: ingest --file <path>");
    }
    if (options.command == Command::Ask && options.question.empty()) {
        throw CliError("Ask command requires a question. Usage: ask --question <text>");
    }
    if (options.command == Command::Remove && options.filename.empty()) {
        throw CliError("Remove command requires a filename. Usage: remove --filename <name>");
    }

    return options;
}

int CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ingest:
            return handle_ingest_command(options);
        case Command::Ask:
            return handle_ask_command(options);
        case Command::Documents:
            return handle_documents_command(options);
        case Command::Remove:
            return handle_remove_command(options);
        case Command::Scan:
            return handle_scan_command(options);
        case Command::Help:
            print_help();
            return 0;
    }
    return 0;
}

int CliHandler::handle_ingest_command(const CliOptions& options) {
    nlohmann::json data = backend_->ingest(options.file_paths);
    print_json_response(data);
    return data.value("failed", 0) > 0 ? 1 : 0;
}

int CliHandler::handle_ask_command(const CliOptions& options) {
    int top_k = options.top_k > 0 ? options.top_k : default_top_k_;
    nlohmann::json data = backend_->ask(options.question, top_k);
    if (options.references) {
        *out_ << data.value("references_table", std::string()) << std::endl;
        return 0;
    }
    print_json_response(data);
    return 0;
}

int CliHandler::handle_documents_command(const CliOptions& options) {
    print_json_response(backend_->documents());
    return 0;
}

int CliHandler::handle_remove_command(const CliOptions& options) {
    bool removed = backend_->remove(options.filename);
    nlohmann::json data;
    data["filename"] = options.filename;
    data["removed"] = removed;
    print_json_response(data);
    return removed ? 0 : 1;
}

int CliHandler::handle_scan_command(const CliOptions& options) {
    std::string dir = options.dir.empty() ? knowledge_dir_ : options.dir;
    std::vector<std::string> files = backend_->scan(dir);
    nlohmann::json data;
    data["knowledge_dir"] = dir;
    data["files"] = files;
    data["count"] = files.size();
    print_json_response(data);
    return 0;
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    *out_ << response.dump(2) << std::endl;
}

void CliHandler::print_help() {
    std::cout << R"(docqa CLI - Ingest local documents and answer questions from them

USAGE:
    docqa_cli [--config <path>] [--api <url>] <command> [options]

COMMANDS:
    ingest, i        Ingest one or more files
        --file, -f <path>        File to ingest (repeatable)

    ask, a           Answer a question from the ingested documents
        --question, -q <text>    The question
        --top-k, -k <number>     Number of matches (default: default_top_k from config)
        --references             Print a Markdown table of the matches instead of JSON

    documents, ls    List ingested documents

    remove, rm       Remove an ingested document
        --filename, -n <name>    Name the document was ingested under

    scan             List ingestible files in the knowledge directory
        --dir, -d <path>         Directory to scan (default: knowledge_dir from config)

    help             Show this help message

GLOBAL OPTIONS:
    --config <path>  Configuration file (default: docqarc.json; defaults apply if absent)
    --api <url>      Forward commands to a running docqa_api server instead of running
                     them in-process. Also read from DOCQA_API_URL.

EXAMPLES:
    docqa_cli ingest --file notes.md --file todo.txt
    docqa_cli ask --question "What is the deploy process?" --top-k 5
    docqa_cli --api 127.0.0.1:3040 documents
    docqa_cli remove --filename notes.md

Command output is JSON on stdout (except ask --references); progress messages go to stderr.
)" << std::endl;
}

}  // namespace docqa_cli
