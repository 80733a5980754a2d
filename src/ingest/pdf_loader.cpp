#include "nexarag/ingest/pdf_loader.hpp"

#include <poppler/cpp/poppler-document.h>
#include <poppler/cpp/poppler-page.h>

#include <memory>

namespace nexarag::ingest {

common::Result<std::string> extract_pdf_text(const std::filesystem::path &path) {
  std::unique_ptr<poppler::document> document(poppler::document::load_from_file(path.string()));
  if (document == nullptr) {
    return common::Result<std::string>::failure(common::ErrorCode::UnsupportedFormat,
                                                "Unable to parse PDF: " + path.string());
  }
  if (document->is_locked()) {
    return common::Result<std::string>::failure(common::ErrorCode::UnsupportedFormat,
                                                "PDF is password protected: " + path.string());
  }

  std::string text;
  const int pages = document->pages();
  for (int i = 0; i < pages; ++i) {
    if (i > 0) {
      text += '\n';
    }
    std::unique_ptr<poppler::page> page(document->create_page(i));
    if (page == nullptr) {
      continue;
    }
    const poppler::byte_array utf8 = page->text().to_utf8();
    text.append(utf8.begin(), utf8.end());
  }
  return common::Result<std::string>::success(std::move(text));
}

} // namespace nexarag::ingest
