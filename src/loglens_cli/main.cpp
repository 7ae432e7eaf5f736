#include "loglens_cli/cli_handler.hpp"

#include <filesystem>
#include <iostream>

int main(int argc, char *argv[])
{
  try
  {
    loglens_cli::CliOptions options = loglens_cli::CliHandler::parse_arguments(argc, argv);
    if (options.command == loglens_cli::Command::Help)
    {
      loglens_cli::CliHandler::print_help();
      return 0;
    }

    // A missing default config file means built-in defaults; an explicit one must exist.
    loglens_core::Config config =
        std::filesystem::exists(options.config_path) || options.config_path != "loglensrc.json"
            ? loglens_core::Config::from_file(options.config_path)
            : loglens_core::Config::from_json(nlohmann::json::object());

    loglens_cli::CliHandler handler(std::make_unique<loglens_core::ServiceProvider>(config));
    return handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
