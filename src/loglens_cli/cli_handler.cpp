#include "loglens_cli/cli_handler.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <thread>

namespace loglens_cli {

namespace {

volatile std::sig_atomic_t interrupt_requested = 0;

void interrupt_handler(int) {
  interrupt_requested = 1;
}

// For the lifetime of a build: SIGINT cancels `token` after the current batch. The signal
// handler only sets a flag; a watcher thread turns it into the cancellation. The previous
// handler is restored and the thread joined however the build ends.
class InterruptWatcher {
 public:
  explicit InterruptWatcher(loglens_core::CancellationTokenPtr token) {
    interrupt_requested = 0;
    previous_handler_ = std::signal(SIGINT, interrupt_handler);
    watcher_ = std::thread([this, token = std::move(token)]() {
      while (!done_.load()) {
        if (interrupt_requested) {
          std::cout << "\nInterrupt received, cancelling after the current batch..." << std::endl;
          token->cancel();
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    });
  }

  ~InterruptWatcher() {
    done_ = true;
    watcher_.join();
    std::signal(SIGINT, previous_handler_);
  }

  InterruptWatcher(const InterruptWatcher &) = delete;
  InterruptWatcher &operator=(const InterruptWatcher &) = delete;

 private:
  std::atomic<bool> done_{false};
  void (*previous_handler_)(int) = SIG_DFL;
  std::thread watcher_;
};

std::string require_value(int argc, char *argv[], int &i, const std::string &flag) {
  if (i + 1 >= argc) {
    throw CliError(flag + " requires a value");
  }
  return argv[++i];
}

}  // namespace

CliHandler::CliHandler(std::unique_ptr<loglens_core::ServiceProvider> services)
    : services_(std::move(services)) {}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;

  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      options.config_path = require_value(argc, argv, i, arg);
    } else if (arg == "--query" || arg == "-q") {
      options.query = require_value(argc, argv, i, arg);
    } else if (arg == "--top-k" || arg == "-k") {
      std::string value = require_value(argc, argv, i, arg);
      try {
        options.top_k = std::stoi(value);
      } catch (const std::exception &) {
        throw CliError("--top-k expects an integer, got '" + value + "'");
      }
      if (options.top_k <= 0) {
        throw CliError("--top-k must be greater than 0");
      }
    } else if (arg == "--model" || arg == "-m") {
      options.model_id = require_value(argc, argv, i, arg);
    } else if (arg == "--force" || arg == "-f") {
      options.force_rebuild = true;
    } else if (arg == "--answer" || arg == "-a") {
      options.answer = true;
    } else if (arg == "--help" || arg == "-h") {
      options.command = Command::Help;
      return options;
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw CliError("Unknown option: " + arg);
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty()) {
    options.command = Command::Help;
    return options;
  }

  const std::string command = positional[0];
  auto require_issue = [&](const std::string &usage) {
    if (positional.size() < 2) {
      throw CliError("Missing issue id. Usage: " + usage);
    }
    options.issue_id = positional[1];
  };

  if (command == "issues" || command == "ls") {
    options.command = Command::Issues;
  } else if (command == "create") {
    options.command = Command::Create;
    require_issue("create <issue>");
  } else if (command == "upload" || command == "u") {
    options.command = Command::Upload;
    require_issue("upload <issue> <file>...");
    options.files.assign(positional.begin() + 2, positional.end());
    if (options.files.empty()) {
      throw CliError("Upload command requires at least one file. Usage: upload <issue> <file>...");
    }
  } else if (command == "build" || command == "b") {
    options.command = Command::Build;
    require_issue("build <issue> [--model <model_id>] [--force]");
  } else if (command == "query" || command == "q") {
    options.command = Command::Query;
    require_issue("query <issue> --query <text> [--top-k <k>] [--answer]");
    if (options.query.empty()) {
      throw CliError("Query command requires a query. Usage: query <issue> --query <text>");
    }
  } else if (command == "status" || command == "st") {
    options.command = Command::Status;
    require_issue("status <issue>");
  } else if (command == "help" || command == "h") {
    options.command = Command::Help;
  } else {
    throw CliError("Unknown command: " + command);
  }

  return options;
}

int CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Issues:
      return handle_issues_command(options);
    case Command::Create:
      return handle_create_command(options);
    case Command::Upload:
      return handle_upload_command(options);
    case Command::Build:
      return handle_build_command(options);
    case Command::Query:
      return handle_query_command(options);
    case Command::Status:
      return handle_status_command(options);
    case Command::Help:
      print_help();
      return 0;
  }
  return 1;
}

int CliHandler::handle_issues_command(const CliOptions &) {
  auto issues = services_->get_log_store().list_issues();
  if (issues.empty()) {
    std::cout << "No issues yet. Create one with: loglens create <issue>" << std::endl;
    return 0;
  }
  for (const auto &issue : issues) {
    std::cout << issue << std::endl;
  }
  return 0;
}

int CliHandler::handle_create_command(const CliOptions &options) {
  services_->get_log_store().create_issue(options.issue_id);
  std::cout << "Created issue '" << options.issue_id << "'" << std::endl;
  return 0;
}

int CliHandler::handle_upload_command(const CliOptions &options) {
  auto &store = services_->get_log_store();
  int exit_code = 0;
  for (const auto &file : options.files) {
    try {
      std::string name = store.import_file(options.issue_id, file);
      std::cout << "Uploaded " << name << " to issue '" << options.issue_id << "'" << std::endl;
    } catch (const loglens_core::LogStoreError &e) {
      print_error(e.what());
      exit_code = 1;
    }
  }
  return exit_code;
}

int CliHandler::handle_build_command(const CliOptions &options) {
  loglens_core::BuildOptions build_options =
      loglens_core::BuildOptions::from_config(services_->get_config());
  if (!options.model_id.empty()) {
    build_options.model_id = options.model_id;
  }
  build_options.force_rebuild = options.force_rebuild;
  build_options.cancel = std::make_shared<loglens_core::CancellationToken>();
  build_options.progress = [](loglens_core::BuildStage stage, size_t done, size_t total) {
    std::cout << "  [" << loglens_core::to_string(stage) << "] " << done << "/" << total
              << std::endl;
  };

  std::cout << "Building knowledge base for '" << options.issue_id << "' with "
            << build_options.model_id << (options.force_rebuild ? " (forced)" : "") << std::endl;

  InterruptWatcher interrupt_watcher(build_options.cancel);

  int exit_code = 1;
  try {
    loglens_core::BuildReport report =
        services_->get_knowledge_base_manager().update(options.issue_id, build_options);
    print_build_report(report);
    exit_code = report.ok() ? 0 : 1;
  } catch (const loglens_core::BuildFailure &e) {
    print_build_report(e.report());
    print_error(e.what());
  } catch (const loglens_core::ConfigurationError &e) {
    print_error(std::string("Invalid build configuration: ") + e.what());
  }
  return exit_code;
}

int CliHandler::handle_query_command(const CliOptions &options) {
  const int top_k = options.top_k > 0 ? options.top_k : services_->get_config().top_k;
  std::cout << "Query: " << options.query << " (top_k: " << top_k << ")" << std::endl;

  try {
    if (options.answer) {
      loglens_core::QueryAnswer answer =
          services_->get_query_service().ask(options.issue_id, options.query, top_k);
      std::cout << "\n" << answer.answer << std::endl;
      if (!answer.references.empty()) {
        std::cout << "\nReferences:" << std::endl;
        for (const auto &reference : answer.references) {
          std::cout << "  - " << reference << std::endl;
        }
      }
      return 0;
    }

    auto results = services_->get_retriever().retrieve(options.issue_id, options.query, top_k);
    if (results.empty()) {
      std::cout << "No results." << std::endl;
      return 0;
    }
    for (size_t i = 0; i < results.size(); ++i) {
      std::cout << "\n" << i + 1 << ". " << results[i].citation() << "  (score "
                << std::fixed << std::setprecision(4) << results[i].score << ")" << std::endl;
      std::cout << results[i].chunk.text << std::endl;
    }
    return 0;
  } catch (const loglens_core::KnowledgeBaseNotFoundError &e) {
    print_error(std::string(e.what()) + ". Run: loglens build " + options.issue_id);
  } catch (const loglens_core::ModelMismatchError &e) {
    print_error(e.what());
  } catch (const loglens_core::ProviderError &e) {
    print_error(std::string("Could not embed the query: ") + e.what());
  }
  return 1;
}

int CliHandler::handle_status_command(const CliOptions &options) {
  auto status = services_->get_knowledge_base_manager().status(options.issue_id);
  if (!status.committed) {
    std::cout << "Issue '" << options.issue_id << "' has no knowledge base yet." << std::endl;
  } else {
    const auto &kb = *status.committed;
    std::cout << "Knowledge base of '" << options.issue_id << "'" << std::endl;
    std::cout << "  Generation: " << kb.generation << " (" << loglens_core::to_string(kb.commit_mode)
              << ")" << std::endl;
    std::cout << "  Model:      " << kb.model_id << std::endl;
    std::cout << "  Chunks:     " << kb.chunk_count << std::endl;
    std::cout << "  Built at:   " << kb.built_at << std::endl;
    std::cout << "  Files:" << std::endl;
    for (const auto &file : kb.source_files) {
      std::cout << "    " << file.name << " (" << file.size << " bytes, " << file.chunk_count
                << " chunks)" << std::endl;
    }
    if (kb.models_history.size() > 1) {
      std::cout << "  Model history:" << std::endl;
      for (const auto &entry : kb.models_history) {
        std::cout << "    gen " << entry.generation << ": " << entry.model_id << std::endl;
      }
    }
  }
  if (status.last_build) {
    std::cout << "Last build: " << loglens_core::to_string(status.last_build->status) << " at "
              << status.last_build->finished_at << std::endl;
    if (!status.last_build->error.empty()) {
      std::cout << "  Error: " << status.last_build->error << std::endl;
    }
  }
  return 0;
}

void CliHandler::print_build_report(const loglens_core::BuildReport &report) {
  std::cout << "Build " << loglens_core::to_string(report.status);
  if (report.generation > 0) {
    std::cout << " (generation " << report.generation << ")";
  }
  std::cout << std::endl;
  std::cout << "  Model:              " << report.model_id << std::endl;
  std::cout << "  Chunks processed:   " << report.chunks_processed << std::endl;
  std::cout << "  Cache hits:         " << report.cache_hits << std::endl;
  std::cout << "  Cache misses:       " << report.cache_misses << std::endl;
  std::cout << "  Embedding failures: " << report.embedding_failures << std::endl;
  if (report.cache_rejections > 0) {
    std::cout << "  Cache rejections:   " << report.cache_rejections << std::endl;
  }
  if (!report.error.empty()) {
    std::cout << "  Error:              " << report.error << std::endl;
  }
}

void CliHandler::print_error(const std::string &error) {
  std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
  std::cout << "loglens - ask questions about your log files\n\n"
            << "Usage: loglens [--config <path>] <command> [options]\n\n"
            << "Commands:\n"
            << "  issues                               List issues\n"
            << "  create <issue>                       Create an issue workspace\n"
            << "  upload <issue> <file>...             Add log files to an issue\n"
            << "  build <issue> [--model M] [--force]  Build or update the knowledge base\n"
            << "  query <issue> --query Q [--top-k K] [--answer]\n"
            << "                                       Search the logs, optionally ask the LLM\n"
            << "  status <issue>                       Show knowledge base and last build\n"
            << "  help                                 Show this message\n\n"
            << "Configuration is read from loglensrc.json unless --config is given.\n"
            << "Press Ctrl-C during a build to cancel it after the current batch." << std::endl;
}

}  // namespace loglens_cli
