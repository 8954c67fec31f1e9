#pragma once

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "getweb_core/pdf/pdf_text_extractor.hpp"
#include "getweb_services/http_fetcher.hpp"

namespace getweb_cli {

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class Config {
 public:
  static constexpr const char* DEFAULT_FILE = "getwebrc.json";
  static constexpr const char* ENV_VAR = "GETWEB_CONFIG";

  std::string user_agent;
  long timeout_seconds;
  long max_redirects;
  std::uint64_t pdf_max_bytes;
  std::size_t cache_capacity;
  long cache_ttl_seconds;
  std::size_t default_max_length;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw ConfigError(std::string("Failed to parse JSON in config file '") + filename +
                        "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw ConfigError("Config must be a JSON object");
    }

    Config config;
    try {
      config.user_agent = json_config.value(
          "user_agent", std::string(getweb_services::CurlHttpFetcher::FIREFOX_USER_AGENT));
      config.timeout_seconds = json_config.value("timeout_seconds", 30L);
      config.max_redirects = json_config.value("max_redirects", 5L);
      config.cache_ttl_seconds = json_config.value("cache_ttl_seconds", 300L);

      // Signed reads so a negative value is reported instead of wrapping around
      long capacity = json_config.value("cache_capacity", 5L);
      long max_length = json_config.value("default_max_length", 10000L);
      std::int64_t pdf_limit = json_config.value(
          "pdf_max_bytes",
          static_cast<std::int64_t>(getweb_core::PdfTextExtractor::DEFAULT_MAX_BYTES));
      if (capacity < 0) {
        throw ConfigError("cache_capacity cannot be negative");
      }
      if (max_length < 0) {
        throw ConfigError("default_max_length cannot be negative");
      }
      if (pdf_limit <= 0) {
        throw ConfigError("pdf_max_bytes must be greater than 0");
      }
      config.cache_capacity = static_cast<std::size_t>(capacity);
      config.pdf_max_bytes = static_cast<std::uint64_t>(pdf_limit);
      config.default_max_length = static_cast<std::size_t>(max_length);
    } catch (const nlohmann::json::exception& e) {
      throw ConfigError(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
  }

  /**
   * @brief Resolves and loads the CLI configuration.
   *
   * Path precedence: explicit_path, then $GETWEB_CONFIG, then getwebrc.json in
   * the working directory. Only the default file may be absent, in which case
   * defaults apply.
   */
  static Config load(const std::string& explicit_path = "") {
    if (!explicit_path.empty()) {
      return from_file(explicit_path);
    }
    if (const char* env_path = std::getenv(ENV_VAR); env_path != nullptr && *env_path != '\0') {
      return from_file(env_path);
    }
    if (std::filesystem::exists(DEFAULT_FILE)) {
      return from_file(DEFAULT_FILE);
    }
    return from_json(nlohmann::json::object());
  }

 private:
  void validate() const {
    if (user_agent.empty()) {
      throw ConfigError("user_agent cannot be empty");
    }
    if (timeout_seconds <= 0) {
      throw ConfigError("timeout_seconds must be greater than 0");
    }
    if (max_redirects < 0) {
      throw ConfigError("max_redirects cannot be negative");
    }
    if (pdf_max_bytes == 0) {
      throw ConfigError("pdf_max_bytes must be greater than 0");
    }
    if (cache_ttl_seconds <= 0) {
      throw ConfigError("cache_ttl_seconds must be greater than 0");
    }
    if (default_max_length < 1000 || default_max_length > 50000) {
      throw ConfigError("default_max_length must be between 1000 and 50000");
    }
  }
};

}  // namespace getweb_cli
