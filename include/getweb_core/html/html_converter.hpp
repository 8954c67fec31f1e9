#pragma once

#include <exception>
#include <string>
#include <string_view>

#include "getweb_core/types.hpp"

namespace getweb_core {

class HtmlConversionError : public std::exception {
 public:
  explicit HtmlConversionError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Parses UTF-8 HTML leniently and renders it as Markdown or plain text.
class HtmlConverter {
 public:
  explicit HtmlConverter(OutputFormat format = OutputFormat::Markdown) : format_(format) {}

  // Empty or whitespace-only input yields an empty string
  std::string convert(std::string_view html) const;

  OutputFormat format() const {
    return format_;
  }

 private:
  OutputFormat format_;
};

}  // namespace getweb_core
