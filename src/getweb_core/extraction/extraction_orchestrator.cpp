#include "getweb_core/extraction/extraction_orchestrator.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "getweb_core/content/binary_classifier.hpp"
#include "getweb_core/content/charset_decoder.hpp"
#include "getweb_core/html/html_converter.hpp"

namespace getweb_core {

namespace {

std::string content_type_or_unknown(const std::optional<std::string>& content_type) {
  return content_type.value_or("unknown");
}

}  // namespace

ExtractionOrchestrator::ExtractionOrchestrator(std::shared_ptr<PdfTextExtractor> pdf_extractor)
    : pdf_extractor_(std::move(pdf_extractor)) {
  if (!pdf_extractor_) {
    throw std::invalid_argument("ExtractionOrchestrator requires a PDF extractor");
  }
}

bool ExtractionOrchestrator::is_html_content_type(const std::optional<std::string>& content_type) {
  if (!content_type) {
    return false;
  }
  std::string mime = BinaryClassifier::primary_mime(*content_type);
  return mime == "text/html" || mime == "application/xhtml+xml";
}

ExtractedContent ExtractionOrchestrator::extract(const std::string& url,
                                                 const RawFetch& fetch,
                                                 const ExtractionOptions& options) const {
  try {
    return run_pipeline(url, fetch, options);
  } catch (const ExtractionError&) {
    throw;
  } catch (const std::exception& e) {
    // The raw message stays in the log; callers only see the generic error
    std::cerr << "[Orchestrator] Unexpected failure for " << url << ": " << e.what() << std::endl;
    throw ExtractionError(ErrorCode::UnknownFailure,
                          "An unknown error occurred while fetching the content",
                          {{"url", url}, {"hint", "Please try again later or provide a different URL."}});
  }
}

ExtractedContent ExtractionOrchestrator::run_pipeline(const std::string& url,
                                                      const RawFetch& fetch,
                                                      const ExtractionOptions& options) const {
  std::string_view head(fetch.bytes);
  head = head.substr(0, BinaryClassifier::HEAD_BYTES);

  if (BinaryClassifier::is_pdf(fetch.content_type, head)) {
    return extract_pdf(url, fetch);
  }

  ClassificationVerdict verdict = BinaryClassifier::classify(fetch.content_type, head);
  if (verdict.is_binary()) {
    std::string effective =
        verdict.content_type ? *verdict.content_type : content_type_or_unknown(fetch.content_type);
    std::cerr << "[Orchestrator] Binary content (" << effective << ", " << fetch.bytes.size()
              << " bytes) refused for " << url << std::endl;
    throw ExtractionError(ErrorCode::UnsupportedBinary,
                          "Fetch cannot be performed for this type of content",
                          {{"url", url}, {"contentType", effective}, {"size", fetch.bytes.size()}});
  }

  std::string decoded;
  try {
    decoded = CharsetDecoder::decode(fetch.bytes, fetch.content_type);
  } catch (const DecodeError& e) {
    std::cerr << "[Orchestrator] Decoding failed for " << url << ": " << e.what() << std::endl;
    throw ExtractionError(ErrorCode::DecodeFailure, "Failed to decode textual content to UTF-8",
                          {{"url", url},
                           {"encoding", e.encoding()},
                           {"hint", "The page encoding could not be reliably decoded."}});
  }

  if (is_html_content_type(fetch.content_type)) {
    return extract_html(url, decoded, fetch, options);
  }

  return ExtractedContent{std::move(decoded), fetch.content_type, ExtractionKind::PlainText, false};
}

ExtractedContent ExtractionOrchestrator::extract_pdf(const std::string& url,
                                                     const RawFetch& fetch) const {
  try {
    std::string text = pdf_extractor_->extract(fetch.bytes);
    return ExtractedContent{std::move(text), fetch.content_type, ExtractionKind::Pdf, false};
  } catch (const PdfError& e) {
    std::cerr << "[Orchestrator] PDF extraction failed for " << url << ": " << e.what()
              << std::endl;

    nlohmann::json details = {{"url", url},
                              {"contentType", content_type_or_unknown(fetch.content_type)},
                              {"size", fetch.bytes.size()}};
    switch (e.kind()) {
      case PdfError::Kind::TooLarge:
        details["limit"] = pdf_extractor_->max_bytes();
        throw ExtractionError(ErrorCode::PdfTooLarge, "PDF exceeds the allowed size limit",
                              details);
      case PdfError::Kind::Encrypted:
        details["hint"] = "Try providing an unencrypted PDF or remove password protection";
        throw ExtractionError(ErrorCode::PdfEncrypted, "Encrypted PDF is not supported", details);
      case PdfError::Kind::Parse:
        break;
    }
    details["hint"] = "Try another file or re-save the PDF to simplify its structure";
    throw ExtractionError(ErrorCode::PdfParseFailure, "Failed to parse PDF content", details);
  }
}

ExtractedContent ExtractionOrchestrator::extract_html(const std::string& url,
                                                      const std::string& decoded,
                                                      const RawFetch& fetch,
                                                      const ExtractionOptions& options) const {
  HtmlConverter converter(options.output_format);

  try {
    if (options.extract_main_content) {
      auto fragment = selector_.select(decoded);
      if (fragment && fragment->kind == FragmentKind::Main) {
        return ExtractedContent{converter.convert(fragment->html), fetch.content_type,
                                ExtractionKind::HtmlMain, true};
      }
      // Low-confidence matches are discarded; the whole document is converted instead
      std::cerr << "[Orchestrator] Main content not found for " << url
                << ", converting full document" << std::endl;
    }

    return ExtractedContent{converter.convert(decoded), fetch.content_type,
                            ExtractionKind::HtmlFull, false};
  } catch (const HtmlConversionError& e) {
    std::cerr << "[Orchestrator] HTML conversion failed for " << url << ": " << e.what()
              << std::endl;
    throw ExtractionError(
        ErrorCode::HtmlConversionFailure, "Failed to convert HTML content to text",
        {{"url", url}, {"hint", "The page structure could not be converted into text content."}});
  }
}

}  // namespace getweb_core
