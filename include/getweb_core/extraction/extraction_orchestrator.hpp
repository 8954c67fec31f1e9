#pragma once

#include <memory>
#include <optional>
#include <string>

#include "getweb_core/errors.hpp"
#include "getweb_core/html/main_content_selector.hpp"
#include "getweb_core/pdf/pdf_text_extractor.hpp"
#include "getweb_core/types.hpp"

namespace getweb_core {

struct ExtractionOptions {
  bool extract_main_content = true;
  OutputFormat output_format = OutputFormat::Markdown;
};

/**
 * @brief Runs one fetched resource through the extraction pipeline.
 *
 * PDF check first, then the binary guard, charset decoding, and for HTML
 * content types main-content selection plus conversion. Every failure leaves
 * as an ExtractionError; nothing else escapes extract().
 */
class ExtractionOrchestrator {
 public:
  explicit ExtractionOrchestrator(std::shared_ptr<PdfTextExtractor> pdf_extractor);
  virtual ~ExtractionOrchestrator() = default;

  virtual ExtractedContent extract(const std::string& url,
                                   const RawFetch& fetch,
                                   const ExtractionOptions& options = {}) const;

  // True for text/html and application/xhtml+xml, parameters ignored
  static bool is_html_content_type(const std::optional<std::string>& content_type);

 private:
  ExtractedContent run_pipeline(const std::string& url,
                                const RawFetch& fetch,
                                const ExtractionOptions& options) const;
  ExtractedContent extract_pdf(const std::string& url, const RawFetch& fetch) const;
  ExtractedContent extract_html(const std::string& url,
                                const std::string& decoded,
                                const RawFetch& fetch,
                                const ExtractionOptions& options) const;

  std::shared_ptr<PdfTextExtractor> pdf_extractor_;
  MainContentSelector selector_;
};

}  // namespace getweb_core
