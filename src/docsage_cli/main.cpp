#include <csignal>
#include <filesystem>
#include <iostream>

#include "docsage_cli/cli_handler.hpp"
#include "docsage_cli/config.hpp"
#include "docsage_core/async/cancellation_token.hpp"
#include "docsage_core/errors.hpp"

namespace {

docsage_core::async::CancellationToken cancel_token;

// The signal handler function
void signal_handler(int /*signal*/) {
  cancel_token.cancel();
}

docsage_cli::Config load_config(const docsage_cli::CliOptions &options) {
  if (!options.config_path.empty()) {
    return docsage_cli::Config::from_file(options.config_path);
  }
  if (std::filesystem::exists("docsagerc.json")) {
    return docsage_cli::Config::from_file("docsagerc.json");
  }
  return docsage_cli::Config::from_json(nlohmann::json::object());
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    docsage_cli::CliOptions options = docsage_cli::CliHandler::parse_arguments(argc, argv);
    if (options.command == docsage_cli::Command::Help) {
      docsage_cli::CliHandler::print_help(std::cout);
      return 0;
    }

    docsage_cli::CliHandler handler(load_config(options));

    std::signal(SIGINT, signal_handler);
    return handler.execute_command(options, &cancel_token);
  } catch (const docsage_cli::CliError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    std::cerr << "Run 'docsage help' for usage." << std::endl;
    return 2;
  } catch (const docsage_core::CancelledError &e) {
    std::cerr << "Interrupted: " << e.what() << std::endl;
    return 130;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
