#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>
#include <utility>
#include <vector>

#include "getweb_cli/cli_handler.hpp"

namespace getweb_cli {

class CliParseTest : public ::testing::Test {
 protected:
  CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "getweb");
    storage_ = std::move(args);
    argv_.clear();
    for (auto& arg : storage_) {
      argv_.push_back(arg.data());
    }
    return CliHandler::parse_arguments(static_cast<int>(argv_.size()), argv_.data());
  }

  std::vector<std::string> storage_;
  std::vector<char*> argv_;
};

TEST_F(CliParseTest, NoArgumentsShowsHelp) {
  EXPECT_EQ(parse({}).command, Command::Help);
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
}

TEST_F(CliParseTest, ParsesFetchWithOptions) {
  CliOptions options = parse({"fetch", "--url", "example.com", "-n", "2500", "--no-main",
                              "--format", "text", "--config", "/tmp/rc.json"});

  EXPECT_EQ(options.command, Command::Fetch);
  EXPECT_EQ(options.url, "example.com");
  EXPECT_EQ(options.max_length, std::optional<std::size_t>(2500));
  EXPECT_FALSE(options.extract_main_content);
  EXPECT_EQ(options.output_format, getweb_core::OutputFormat::PlainText);
  EXPECT_EQ(options.config_path, "/tmp/rc.json");
}

TEST_F(CliParseTest, FetchDefaults) {
  CliOptions options = parse({"f", "-u", "https://example.com"});

  EXPECT_EQ(options.command, Command::Fetch);
  EXPECT_FALSE(options.max_length.has_value());
  EXPECT_TRUE(options.extract_main_content);
  EXPECT_EQ(options.output_format, getweb_core::OutputFormat::Markdown);
}

TEST_F(CliParseTest, ParsesFileCommand) {
  CliOptions options = parse({"file", "-p", "page.html", "--content-type", "text/html"});

  EXPECT_EQ(options.command, Command::File);
  EXPECT_EQ(options.file_path, "page.html");
  EXPECT_EQ(options.content_type, std::optional<std::string>("text/html"));
}

TEST_F(CliParseTest, MetadataRequiresUrl) {
  EXPECT_EQ(parse({"m", "--url", "example.com"}).command, Command::Metadata);
  EXPECT_THROW(parse({"metadata"}), CliError);
}

TEST_F(CliParseTest, RejectsBadInput) {
  EXPECT_THROW(parse({"download"}), CliError);
  EXPECT_THROW(parse({"fetch", "--url"}), CliError);
  EXPECT_THROW(parse({"fetch", "--url", "x", "--verbose"}), CliError);
  EXPECT_THROW(parse({"fetch", "--url", "x", "--max-length", "0"}), CliError);
  EXPECT_THROW(parse({"fetch", "--url", "x", "--max-length", "12abc"}), CliError);
  EXPECT_THROW(parse({"fetch", "--url", "x", "--format", "pdf"}), CliError);
  EXPECT_THROW(parse({"file"}), CliError);
}

TEST(CliContentTypeTest, GuessesFromExtension) {
  EXPECT_EQ(CliHandler::guess_content_type("a/b/Page.HTML"), std::optional<std::string>("text/html"));
  EXPECT_EQ(CliHandler::guess_content_type("doc.pdf"),
            std::optional<std::string>("application/pdf"));
  EXPECT_EQ(CliHandler::guess_content_type("notes.txt"), std::optional<std::string>("text/plain"));
  EXPECT_FALSE(CliHandler::guess_content_type("archive.bin").has_value());
}

}  // namespace getweb_cli
