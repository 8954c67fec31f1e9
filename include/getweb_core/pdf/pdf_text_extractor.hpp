#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <string_view>

namespace getweb_core {

class PdfError : public std::exception {
 public:
  enum class Kind { Parse, Encrypted, TooLarge };

  PdfError(Kind kind, const std::string& message) : kind_(kind), message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }
  Kind kind() const noexcept {
    return kind_;
  }

 private:
  Kind kind_;
  std::string message_;
};

/**
 * @brief Base for PDF text back ends.
 *
 * extract() enforces the size ceiling before any parsing and folds whatever
 * the back end throws into a PdfError: Encrypted when the failure message
 * mentions encryption or a password, Parse otherwise.
 */
class PdfTextExtractor {
 public:
  static constexpr std::size_t DEFAULT_MAX_BYTES = 500ull * 1024 * 1024;

  explicit PdfTextExtractor(std::size_t max_bytes = DEFAULT_MAX_BYTES) : max_bytes_(max_bytes) {}
  virtual ~PdfTextExtractor() = default;

  virtual std::string extract(std::string_view bytes) const;

  std::size_t max_bytes() const {
    return max_bytes_;
  }

 protected:
  // Back end hook; may throw any std::exception
  virtual std::string extract_text(std::string_view bytes) const = 0;

 private:
  std::size_t max_bytes_;
};

// Extracts page text with MuPDF's structured-text device.
class MupdfTextExtractor : public PdfTextExtractor {
 public:
  using PdfTextExtractor::PdfTextExtractor;

 protected:
  std::string extract_text(std::string_view bytes) const override;
};

}  // namespace getweb_core
