#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "../../common/mocks_test.hpp"
#include "getweb_core/errors.hpp"
#include "getweb_services/http_fetcher.hpp"
#include "getweb_services/url_content_service.hpp"

namespace getweb_services {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::Return;
using ::testing::Throw;
using getweb_core::ErrorCode;
using getweb_core::ExtractionError;
using getweb_core::ExtractionKind;
using getweb_tests::MockHttpFetcher;
using getweb_tests::MockPdfTextExtractor;
using getweb_tests::MockUtilities::fetch_with_type;
using getweb_tests::MockUtilities::html_fetch;

class UrlContentServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    fetcher_ = std::make_shared<MockHttpFetcher>();
    pdf_ = std::make_shared<MockPdfTextExtractor>();
    orchestrator_ = std::make_shared<getweb_core::ExtractionOrchestrator>(pdf_);
    cache_ = std::make_shared<ContentCache>(5, std::chrono::seconds(300));
    service_ = std::make_unique<UrlContentService>(fetcher_, orchestrator_, cache_);
  }

  ExtractionError fetch_error(const std::string& url) {
    try {
      service_->fetch_content(url, FetchRequest{});
    } catch (const ExtractionError& e) {
      return e;
    }
    throw std::logic_error("fetch_content() did not fail");
  }

  std::shared_ptr<MockHttpFetcher> fetcher_;
  std::shared_ptr<MockPdfTextExtractor> pdf_;
  std::shared_ptr<getweb_core::ExtractionOrchestrator> orchestrator_;
  std::shared_ptr<ContentCache> cache_;
  std::unique_ptr<UrlContentService> service_;
};

TEST_F(UrlContentServiceTest, RequiresFetcherAndOrchestrator) {
  EXPECT_THROW(UrlContentService service(nullptr, orchestrator_, cache_), std::invalid_argument);
  EXPECT_THROW(UrlContentService service(fetcher_, nullptr, cache_), std::invalid_argument);
  EXPECT_NO_THROW(UrlContentService service(fetcher_, orchestrator_, nullptr));
}

TEST_F(UrlContentServiceTest, NormalizesSchemelessUrls) {
  EXPECT_EQ(UrlContentService::normalize_url("example.com/a"), "https://example.com/a");
  EXPECT_EQ(UrlContentService::normalize_url("  http://example.com "), "http://example.com");
}

TEST_F(UrlContentServiceTest, FetchesAndExtractsMainContent) {
  EXPECT_CALL(*fetcher_, fetch("https://example.com/post"))
      .WillOnce(Return(html_fetch("<html><body><nav>Links</nav><main><p>Main text</p></main>"
                                  "</body></html>")));

  auto content = service_->fetch_content("example.com/post", FetchRequest{});

  EXPECT_EQ(content.kind, ExtractionKind::HtmlMain);
  EXPECT_EQ(content.text, "Main text");
}

TEST_F(UrlContentServiceTest, RepeatedRequestIsServedFromCache) {
  EXPECT_CALL(*fetcher_, fetch(_)).Times(1).WillOnce(Return(html_fetch("<p>Cached body</p>")));

  auto first = service_->fetch_content("https://example.com", FetchRequest{});
  auto second = service_->fetch_content("https://example.com", FetchRequest{});

  EXPECT_EQ(first.text, second.text);
  EXPECT_EQ(cache_->size(), 1u);
}

TEST_F(UrlContentServiceTest, DifferentOptionsAreCachedSeparately) {
  EXPECT_CALL(*fetcher_, fetch(_))
      .Times(2)
      .WillRepeatedly(Return(html_fetch("<p><strong>Body</strong></p>")));

  FetchRequest markdown;
  FetchRequest plain;
  plain.output_format = getweb_core::OutputFormat::PlainText;

  EXPECT_EQ(service_->fetch_content("https://example.com", markdown).text, "**Body**");
  EXPECT_EQ(service_->fetch_content("https://example.com", plain).text, "Body");
}

TEST_F(UrlContentServiceTest, FailedExtractionIsNotCached) {
  std::string jpeg("\xFF\xD8\xFF\xE0", 4);
  EXPECT_CALL(*fetcher_, fetch(_)).WillOnce(Return(fetch_with_type(jpeg, "image/jpeg")));

  EXPECT_EQ(fetch_error("https://example.com/pic").code(), ErrorCode::UnsupportedBinary);
  EXPECT_EQ(cache_->size(), 0u);
}

TEST_F(UrlContentServiceTest, HttpStatusErrorsAreReported) {
  EXPECT_CALL(*fetcher_, fetch(_))
      .WillOnce(Throw(HttpFetchError("HTTP error 404: Not Found", 404, "Not Found")));

  ExtractionError error = fetch_error("https://example.com/missing");

  EXPECT_EQ(error.code(), ErrorCode::HttpFailure);
  EXPECT_EQ(error.message(), "HTTP error 404: Not Found");
  EXPECT_EQ(error.details()["httpStatus"], 404);
  EXPECT_EQ(error.details()["hint"], "The resource was not found (404).");
}

TEST_F(UrlContentServiceTest, ServerErrorsGetGenericHint) {
  EXPECT_CALL(*fetcher_, fetch(_))
      .WillOnce(Throw(HttpFetchError("HTTP error 503: Service Unavailable", 503,
                                     "Service Unavailable")));

  ExtractionError error = fetch_error("https://example.com/busy");

  EXPECT_EQ(error.details()["hint"], "Please verify the URL and try again.");
  EXPECT_EQ(error.details()["reason"], "Service Unavailable");
}

TEST_F(UrlContentServiceTest, NetworkErrorsAreReported) {
  EXPECT_CALL(*fetcher_, fetch(_))
      .WillOnce(Throw(HttpFetchError("CURL request failed: Couldn't resolve host name", 0)));

  ExtractionError error = fetch_error("https://nowhere.invalid");

  EXPECT_EQ(error.code(), ErrorCode::HttpFailure);
  EXPECT_EQ(error.message(), "Network error during HTTP fetch");
  EXPECT_THAT(error.to_payload(), HasSubstr("\"code\":\"ERR_FETCH_HTTP\""));
}

TEST_F(UrlContentServiceTest, FetchesPageMetadata) {
  EXPECT_CALL(*fetcher_, fetch("https://example.com/page"))
      .WillOnce(Return(html_fetch(
          "<html><head><title>Example</title>"
          "<meta name=\"description\" content=\"An example page\"></head></html>")));

  auto metadata = service_->fetch_metadata("example.com/page");

  EXPECT_EQ(metadata.title, "Example");
  EXPECT_EQ(metadata.description, "An example page");
  EXPECT_EQ(metadata.url, "https://example.com/page");
  EXPECT_EQ(metadata.favicon,
            std::optional<std::string>("https://www.google.com/s2/favicons?domain=example.com&sz=32"));
}

TEST_F(UrlContentServiceTest, MetadataOfBinaryResourceIsRefused) {
  EXPECT_CALL(*fetcher_, fetch(_))
      .WillOnce(Return(fetch_with_type("%PDF-1.7", "application/pdf")));

  try {
    service_->fetch_metadata("https://example.com/doc.pdf");
    FAIL() << "Expected ExtractionError";
  } catch (const ExtractionError& e) {
    EXPECT_EQ(e.code(), ErrorCode::UnsupportedBinary);
    EXPECT_EQ(e.details()["contentType"], "application/pdf");
  }
}

TEST(FetchReportTest, ShortContentIsPrintedWithSettingsFooter) {
  getweb_core::ExtractedContent content{"Hello", std::string("text/html"),
                                        ExtractionKind::HtmlMain, true};

  std::string report =
      UrlContentService::render_fetch_report("https://example.com", content, FetchRequest{});

  EXPECT_EQ(report,
            "Hello\n---\nExtraction settings:\n"
            "- URL: https://example.com\n"
            "- Main content extraction: Enabled\n"
            "- Extraction kind: HtmlMain\n"
            "- Main fragment used: Yes\n"
            "- Output format: markdown\n"
            "- Content length: 5 characters\n---");
}

TEST(FetchReportTest, LongContentIsTruncatedWithMarker) {
  getweb_core::ExtractedContent content{std::string(3000, 'a'), std::nullopt,
                                        ExtractionKind::PlainText, false};
  FetchRequest request;
  request.max_length = 1000;
  request.extract_main_content = false;

  std::string report = UrlContentService::render_fetch_report("https://example.com", content,
                                                              request);
  std::string body = report.substr(0, report.find("\n---\n"));

  EXPECT_EQ(body.size(), 1000u);
  EXPECT_THAT(body, ::testing::EndsWith(UrlContentService::TRUNCATION_SUFFIX));
  EXPECT_THAT(report, HasSubstr("- Main content extraction: Disabled"));
  EXPECT_THAT(report, HasSubstr("- Content length: 3000 characters (truncated to 1000)"));
}

TEST(CurlHttpFetcherTest, ReasonPhrases) {
  EXPECT_EQ(CurlHttpFetcher::reason_phrase(404), "Not Found");
  EXPECT_EQ(CurlHttpFetcher::reason_phrase(503), "Service Unavailable");
  EXPECT_EQ(CurlHttpFetcher::reason_phrase(418), "Unknown error");
}

TEST(CurlHttpFetcherTest, RefusedConnectionIsTransportError) {
  CurlHttpFetcher fetcher(HttpFetcherOptions{"", 5, 0});
  try {
    fetcher.fetch("http://127.0.0.1:1/");
    FAIL() << "Expected HttpFetchError";
  } catch (const HttpFetchError& e) {
    EXPECT_EQ(e.status(), 0);
    EXPECT_THAT(e.what(), HasSubstr("CURL request failed"));
  }
}

}  // namespace getweb_services
