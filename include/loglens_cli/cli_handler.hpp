#pragma once

#include <memory>
#include <string>
#include <vector>

#include "loglens_core/service_provider.hpp"

namespace loglens_cli
{

  enum class Command
  {
    Issues,
    Create,
    Upload,
    Build,
    Query,
    Status,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string config_path = "loglensrc.json";
    std::string issue_id;
    std::vector<std::string> files;
    std::string query;
    int top_k = 0;  // 0 means the configured default
    std::string model_id;
    bool force_rebuild = false;
    bool answer = false;
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
    explicit CliHandler(std::unique_ptr<loglens_core::ServiceProvider> services);

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    static CliOptions parse_arguments(int argc, char *argv[]);

    // Returns the process exit code.
    int execute_command(const CliOptions &options);

    static void print_help();

  private:
    std::unique_ptr<loglens_core::ServiceProvider> services_;

    int handle_issues_command(const CliOptions &options);
    int handle_create_command(const CliOptions &options);
    int handle_upload_command(const CliOptions &options);
    int handle_build_command(const CliOptions &options);
    int handle_query_command(const CliOptions &options);
    int handle_status_command(const CliOptions &options);

    void print_build_report(const loglens_core::BuildReport &report);
    void print_error(const std::string &error);
  };

}
