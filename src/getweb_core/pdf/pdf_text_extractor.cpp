#include "getweb_core/pdf/pdf_text_extractor.hpp"

#include <iostream>

#include "getweb_core/utils/text_utils.hpp"

namespace getweb_core {

std::string PdfTextExtractor::extract(std::string_view bytes) const {
  if (bytes.size() > max_bytes_) {
    std::cerr << "[PdfExtractor] Refusing " << bytes.size() << " byte PDF (limit " << max_bytes_
              << ")" << std::endl;
    throw PdfError(PdfError::Kind::TooLarge, "PDF exceeds the maximum supported size of " +
                                                 std::to_string(max_bytes_) + " bytes");
  }

  try {
    return extract_text(bytes);
  } catch (const PdfError&) {
    throw;
  } catch (const std::exception& e) {
    std::string message = e.what();
    if (text::contains_ignore_case(message, "encrypt") ||
        text::contains_ignore_case(message, "password")) {
      throw PdfError(PdfError::Kind::Encrypted, message);
    }
    throw PdfError(PdfError::Kind::Parse, message);
  }
}

}  // namespace getweb_core
