#include <curl/curl.h>

#include <iostream>

#include "getweb_cli/cli_handler.hpp"
#include "getweb_cli/config.hpp"
#include "getweb_core/errors.hpp"

int main(int argc, char* argv[]) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  int exit_code = 0;

  try {
    getweb_cli::CliOptions options = getweb_cli::CliHandler::parse_arguments(argc, argv);
    if (options.command == getweb_cli::Command::Help) {
      getweb_cli::CliHandler::print_help();
    } else {
      getweb_cli::Config config = getweb_cli::Config::load(options.config_path);
      getweb_cli::CliHandler handler(config);
      handler.execute_command(options);
    }
  } catch (const getweb_core::ExtractionError& e) {
    std::cerr << e.to_payload() << std::endl;
    exit_code = 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }

  curl_global_cleanup();
  return exit_code;
}
