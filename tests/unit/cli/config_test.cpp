#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "getweb_cli/config.hpp"

namespace getweb_cli {

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/getweb_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5);  // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

}  // namespace

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.user_agent, getweb_services::CurlHttpFetcher::FIREFOX_USER_AGENT);
  EXPECT_EQ(cfg.timeout_seconds, 30);
  EXPECT_EQ(cfg.max_redirects, 5);
  EXPECT_EQ(cfg.pdf_max_bytes, getweb_core::PdfTextExtractor::DEFAULT_MAX_BYTES);
  EXPECT_EQ(cfg.cache_capacity, 5u);
  EXPECT_EQ(cfg.cache_ttl_seconds, 300);
  EXPECT_EQ(cfg.default_max_length, 10000u);
}

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {{"user_agent", "getweb-test/1.0"},
                      {"timeout_seconds", 10},
                      {"max_redirects", 0},
                      {"pdf_max_bytes", 1048576},
                      {"cache_capacity", 0},
                      {"cache_ttl_seconds", 60},
                      {"default_max_length", 2000}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.user_agent, "getweb-test/1.0");
  EXPECT_EQ(cfg.timeout_seconds, 10);
  EXPECT_EQ(cfg.max_redirects, 0);
  EXPECT_EQ(cfg.pdf_max_bytes, 1048576u);
  EXPECT_EQ(cfg.cache_capacity, 0u);
  EXPECT_EQ(cfg.cache_ttl_seconds, 60);
  EXPECT_EQ(cfg.default_max_length, 2000u);
}

TEST(ConfigTest, RejectsInvalidValues) {
  EXPECT_THROW(Config::from_json({{"timeout_seconds", 0}}), ConfigError);
  EXPECT_THROW(Config::from_json({{"max_redirects", -1}}), ConfigError);
  EXPECT_THROW(Config::from_json({{"pdf_max_bytes", -5}}), ConfigError);
  EXPECT_THROW(Config::from_json({{"cache_capacity", -1}}), ConfigError);
  EXPECT_THROW(Config::from_json({{"default_max_length", 999}}), ConfigError);
  EXPECT_THROW(Config::from_json({{"default_max_length", 50001}}), ConfigError);
  EXPECT_THROW(Config::from_json({{"user_agent", ""}}), ConfigError);
}

TEST(ConfigTest, RejectsWrongTypes) {
  EXPECT_THROW(Config::from_json({{"timeout_seconds", "thirty"}}), ConfigError);
  EXPECT_THROW(Config::from_json(nlohmann::json::array({1, 2})), ConfigError);
}

TEST(ConfigTest, LoadsFromFile) {
  std::string path = write_temp_file(R"({"timeout_seconds": 12, "cache_capacity": 3})");

  Config cfg = Config::from_file(path);
  remove_file(path);

  EXPECT_EQ(cfg.timeout_seconds, 12);
  EXPECT_EQ(cfg.cache_capacity, 3u);
}

TEST(ConfigTest, ReportsMissingAndMalformedFiles) {
  EXPECT_THROW(Config::from_file("/nonexistent/getwebrc.json"), ConfigError);

  std::string path = write_temp_file("{ not json");
  EXPECT_THROW(Config::from_file(path), ConfigError);
  remove_file(path);
}

TEST(ConfigTest, LoadPrefersExplicitPathOverEnvironment) {
  std::string env_path = write_temp_file(R"({"timeout_seconds": 7})");
  std::string explicit_path = write_temp_file(R"({"timeout_seconds": 9})");
  setenv(Config::ENV_VAR, env_path.c_str(), 1);

  EXPECT_EQ(Config::load(explicit_path).timeout_seconds, 9);
  EXPECT_EQ(Config::load().timeout_seconds, 7);

  unsetenv(Config::ENV_VAR);
  remove_file(env_path);
  remove_file(explicit_path);
}

TEST(ConfigTest, ExplicitPathMustExist) {
  EXPECT_THROW(Config::load("/nonexistent/custom.json"), ConfigError);
}

}  // namespace getweb_cli
