#include "getweb_cli/cli_handler.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "getweb_core/utils/text_utils.hpp"

namespace getweb_cli {

namespace {

std::string require_value(int argc, char* argv[], int& i, const std::string& flag) {
  if (i + 1 >= argc) {
    throw CliError("Missing value for " + flag);
  }
  return argv[++i];
}

std::size_t parse_max_length(const std::string& value) {
  try {
    std::size_t consumed = 0;
    long parsed = std::stol(value, &consumed);
    if (consumed != value.size() || parsed <= 0) {
      throw CliError("--max-length must be a positive integer, got: " + value);
    }
    return static_cast<std::size_t>(parsed);
  } catch (const std::logic_error&) {
    throw CliError("--max-length must be a positive integer, got: " + value);
  }
}

}  // namespace

CliHandler::CliHandler(const Config& config) : config_(config) {
  auto fetcher = std::make_shared<getweb_services::CurlHttpFetcher>(
      getweb_services::HttpFetcherOptions{config.user_agent, config.timeout_seconds,
                                          config.max_redirects});
  auto pdf_extractor =
      std::make_shared<getweb_core::MupdfTextExtractor>(static_cast<std::size_t>(config.pdf_max_bytes));
  orchestrator_ = std::make_shared<getweb_core::ExtractionOrchestrator>(pdf_extractor);

  std::shared_ptr<getweb_services::ContentCache> cache;
  if (config.cache_capacity > 0) {
    cache = std::make_shared<getweb_services::ContentCache>(
        config.cache_capacity, std::chrono::seconds(config.cache_ttl_seconds));
  }
  service_ = std::make_unique<getweb_services::UrlContentService>(fetcher, orchestrator_, cache);
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
  CliOptions options;
  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[1];
  if (command == "fetch" || command == "f") {
    options.command = Command::Fetch;
  } else if (command == "file") {
    options.command = Command::File;
  } else if (command == "metadata" || command == "m") {
    options.command = Command::Metadata;
  } else if (command == "help" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command);
  }

  for (int i = 2; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag == "--url" || flag == "-u") {
      options.url = require_value(argc, argv, i, flag);
    } else if (flag == "--path" || flag == "-p") {
      options.file_path = require_value(argc, argv, i, flag);
    } else if (flag == "--content-type") {
      options.content_type = require_value(argc, argv, i, flag);
    } else if (flag == "--max-length" || flag == "-n") {
      options.max_length = parse_max_length(require_value(argc, argv, i, flag));
    } else if (flag == "--no-main") {
      options.extract_main_content = false;
    } else if (flag == "--format") {
      std::string value = require_value(argc, argv, i, flag);
      try {
        options.output_format = getweb_core::output_format_from_string(value);
      } catch (const std::invalid_argument& e) {
        throw CliError(e.what());
      }
    } else if (flag == "--config" || flag == "-c") {
      options.config_path = require_value(argc, argv, i, flag);
    } else {
      throw CliError("Unknown option: " + flag);
    }
  }

  if ((options.command == Command::Fetch || options.command == Command::Metadata) &&
      options.url.empty()) {
    throw CliError("This command requires a URL. Usage: " + command + " --url <url>");
  }
  if (options.command == Command::File && options.file_path.empty()) {
    throw CliError("File command requires a path. Usage: file --path <file>");
  }
  return options;
}

void CliHandler::execute_command(const CliOptions& options) {
  switch (options.command) {
    case Command::Fetch:
      handle_fetch_command(options);
      break;
    case Command::File:
      handle_file_command(options);
      break;
    case Command::Metadata:
      handle_metadata_command(options);
      break;
    case Command::Help:
      print_help();
      break;
  }
}

getweb_services::FetchRequest CliHandler::make_request(const CliOptions& options) const {
  getweb_services::FetchRequest request;
  request.max_length = options.max_length.value_or(config_.default_max_length);
  request.extract_main_content = options.extract_main_content;
  request.output_format = options.output_format;
  return request;
}

void CliHandler::handle_fetch_command(const CliOptions& options) {
  auto request = make_request(options);
  auto content = service_->fetch_content(options.url, request);
  std::cout << getweb_services::UrlContentService::render_fetch_report(
                   getweb_services::UrlContentService::normalize_url(options.url), content,
                   request)
            << std::endl;
}

void CliHandler::handle_file_command(const CliOptions& options) {
  std::ifstream file(options.file_path, std::ios::binary);
  if (!file.is_open()) {
    throw CliError("Failed to open file: " + options.file_path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  getweb_core::RawFetch raw;
  raw.bytes = buffer.str();
  raw.content_type = options.content_type ? options.content_type
                                          : guess_content_type(options.file_path);

  std::string url = "file://" + std::filesystem::absolute(options.file_path).string();
  auto request = make_request(options);
  getweb_core::ExtractionOptions extraction;
  extraction.extract_main_content = request.extract_main_content;
  extraction.output_format = request.output_format;

  auto content = orchestrator_->extract(url, raw, extraction);
  std::cout << getweb_services::UrlContentService::render_fetch_report(url, content, request)
            << std::endl;
}

void CliHandler::handle_metadata_command(const CliOptions& options) {
  auto metadata = service_->fetch_metadata(options.url);
  std::cout << getweb_core::format_metadata_report(metadata) << std::endl;
}

std::optional<std::string> CliHandler::guess_content_type(const std::string& path) {
  std::string ext =
      getweb_core::text::to_lower_ascii(std::filesystem::path(path).extension().string());
  if (ext == ".html" || ext == ".htm") {
    return "text/html";
  }
  if (ext == ".xhtml") {
    return "application/xhtml+xml";
  }
  if (ext == ".pdf") {
    return "application/pdf";
  }
  if (ext == ".txt") {
    return "text/plain";
  }
  if (ext == ".md") {
    return "text/markdown";
  }
  if (ext == ".json") {
    return "application/json";
  }
  return std::nullopt;
}

void CliHandler::print_help() {
  std::cout << "getweb - fetch web pages and documents as readable text\n\n"
            << "Usage: getweb <command> [options]\n\n"
            << "Commands:\n"
            << "  fetch     --url <url> [--max-length N] [--no-main] [--format markdown|text]\n"
            << "            Fetch a URL and print its main content\n"
            << "  file      --path <file> [--content-type <type>] [--no-main] [--format ...]\n"
            << "            Extract content from a local file\n"
            << "  metadata  --url <url>\n"
            << "            Print title, description, image and favicon of a page\n"
            << "  help      Show this message\n\n"
            << "Options:\n"
            << "  --config <path>   Config file (default: $GETWEB_CONFIG or ./getwebrc.json)\n"
            << std::endl;
}

}  // namespace getweb_cli
