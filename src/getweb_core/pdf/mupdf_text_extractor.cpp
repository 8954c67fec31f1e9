#include <mupdf/fitz.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "getweb_core/pdf/pdf_text_extractor.hpp"

namespace getweb_core {

namespace {

struct ContextDeleter {
  void operator()(fz_context* ctx) const {
    fz_drop_context(ctx);
  }
};

using ContextPtr = std::unique_ptr<fz_context, ContextDeleter>;

}  // namespace

std::string MupdfTextExtractor::extract_text(std::string_view bytes) const {
  ContextPtr ctx(fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT));
  if (!ctx) {
    throw std::runtime_error("Failed to create MuPDF context");
  }

  fz_stream* stream = nullptr;
  fz_document* doc = nullptr;
  int page_count = 0;
  bool needs_password = false;
  bool opened = false;

  fz_var(stream);
  fz_var(doc);
  fz_var(page_count);
  fz_var(needs_password);
  fz_var(opened);

  fz_try(ctx.get()) {
    fz_register_document_handlers(ctx.get());
    stream = fz_open_memory(ctx.get(), reinterpret_cast<const unsigned char*>(bytes.data()),
                            bytes.size());
    doc = fz_open_document_with_stream(ctx.get(), "application/pdf", stream);
    needs_password = fz_needs_password(ctx.get(), doc) != 0;
    if (!needs_password) {
      page_count = fz_count_pages(ctx.get(), doc);
    }
    opened = true;
  }
  fz_always(ctx.get()) {
    fz_drop_stream(ctx.get(), stream);
  }
  fz_catch(ctx.get()) {
    opened = false;
  }

  if (!opened) {
    std::string error = fz_caught_message(ctx.get());
    fz_drop_document(ctx.get(), doc);
    throw std::runtime_error("Failed to open PDF: " + error);
  }
  if (needs_password) {
    fz_drop_document(ctx.get(), doc);
    throw std::runtime_error("PDF is encrypted and requires a password");
  }

  std::string text;
  for (int page_idx = 0; page_idx < page_count; ++page_idx) {
    fz_page* page = nullptr;
    fz_stext_page* stext_page = nullptr;
    fz_buffer* text_buffer = nullptr;
    bool page_ok = false;

    fz_var(page);
    fz_var(stext_page);
    fz_var(text_buffer);
    fz_var(page_ok);

    fz_try(ctx.get()) {
      page = fz_load_page(ctx.get(), doc, page_idx);
      stext_page = fz_new_stext_page_from_page(ctx.get(), page, nullptr);
      text_buffer = fz_new_buffer_from_stext_page(ctx.get(), stext_page);
      page_ok = true;
    }
    fz_always(ctx.get()) {
      fz_drop_stext_page(ctx.get(), stext_page);
      fz_drop_page(ctx.get(), page);
    }
    fz_catch(ctx.get()) {
      page_ok = false;
    }

    if (!page_ok) {
      std::string error = fz_caught_message(ctx.get());
      fz_drop_buffer(ctx.get(), text_buffer);
      fz_drop_document(ctx.get(), doc);
      throw std::runtime_error("Failed to extract page " + std::to_string(page_idx + 1) + ": " +
                               error);
    }

    unsigned char* data = nullptr;
    size_t len = fz_buffer_storage(ctx.get(), text_buffer, &data);
    if (data != nullptr && len > 0) {
      text.append(reinterpret_cast<const char*>(data), len);
      if (text.back() != '\n') {
        text.push_back('\n');
      }
    }
    fz_drop_buffer(ctx.get(), text_buffer);
  }

  fz_drop_document(ctx.get(), doc);
  return text;
}

}  // namespace getweb_core
