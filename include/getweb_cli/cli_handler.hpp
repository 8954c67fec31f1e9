#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "getweb_cli/config.hpp"
#include "getweb_core/extraction/extraction_orchestrator.hpp"
#include "getweb_core/types.hpp"
#include "getweb_services/url_content_service.hpp"

namespace getweb_cli {

enum class Command { Fetch, File, Metadata, Help };

struct CliOptions {
  Command command = Command::Help;
  std::string url;
  std::string file_path;
  std::optional<std::string> content_type;
  std::optional<std::size_t> max_length;
  bool extract_main_content = true;
  getweb_core::OutputFormat output_format = getweb_core::OutputFormat::Markdown;
  std::string config_path;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  explicit CliHandler(const Config& config);

  CliHandler(const CliHandler&) = delete;
  CliHandler& operator=(const CliHandler&) = delete;

  // Parse command line arguments
  static CliOptions parse_arguments(int argc, char* argv[]);

  // Execute command; extraction failures propagate as getweb_core::ExtractionError
  void execute_command(const CliOptions& options);

  // Content type implied by a local file's extension, nullopt when unknown
  static std::optional<std::string> guess_content_type(const std::string& path);

  static void print_help();

 private:
  void handle_fetch_command(const CliOptions& options);
  void handle_file_command(const CliOptions& options);
  void handle_metadata_command(const CliOptions& options);

  getweb_services::FetchRequest make_request(const CliOptions& options) const;

  Config config_;
  std::shared_ptr<getweb_core::ExtractionOrchestrator> orchestrator_;
  std::unique_ptr<getweb_services::UrlContentService> service_;
};

}  // namespace getweb_cli
