#include "nexarag/ingest/loader.hpp"

#include "nexarag/common/fs.hpp"
#include "nexarag/ingest/pdf_loader.hpp"

#include <algorithm>

namespace nexarag::ingest {

namespace {

const std::vector<std::string> &text_extensions() {
  static const std::vector<std::string> extensions = {".md", ".markdown", ".txt", ".pdf"};
  return extensions;
}

} // namespace

bool FileLoader::supports(const std::filesystem::path &path) const {
  const std::string ext = common::to_lower(path.extension().string());
  const auto &allowed = text_extensions();
  return std::find(allowed.begin(), allowed.end(), ext) != allowed.end();
}

common::Result<std::string> FileLoader::load(const std::filesystem::path &path) {
  if (!supports(path)) {
    const std::string ext = path.extension().string();
    return common::Result<std::string>::failure(
        common::ErrorCode::UnsupportedFormat,
        "Unsupported file type '" + (ext.empty() ? std::string("<none>") : ext) +
            "': " + path.string());
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return common::Result<std::string>::failure(common::ErrorCode::NotFound,
                                                "Not a readable file: " + path.string());
  }
  if (common::to_lower(path.extension().string()) == ".pdf") {
    return extract_pdf_text(path);
  }
  auto content = common::read_file(path);
  if (!content.ok()) {
    return content;
  }
  if (!is_valid_utf8(content.value())) {
    return common::Result<std::string>::failure(common::ErrorCode::UnsupportedFormat,
                                                "File is not valid UTF-8 text: " + path.string());
  }
  return content;
}

GatheredSources gather_sources(const std::vector<std::string> &paths, const IFileLoader &loader) {
  GatheredSources gathered;
  for (const auto &raw : paths) {
    const std::filesystem::path path(common::expand_path(raw));
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      gathered.errors.push_back(
          {path.string(), common::ErrorCode::NotFound, "Path does not exist: " + path.string()});
      continue;
    }
    if (!std::filesystem::is_directory(path, ec)) {
      gathered.files.push_back(path);
      continue;
    }

    std::vector<std::filesystem::path> children;
    std::filesystem::recursive_directory_iterator it(path, ec);
    if (ec) {
      gathered.errors.push_back(
          {path.string(), common::ErrorCode::Io, "Unable to list directory: " + ec.message()});
      continue;
    }
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) {
        break;
      }
      if (it->is_regular_file(ec) && loader.supports(it->path())) {
        children.push_back(it->path());
      }
    }
    if (ec) {
      gathered.errors.push_back(
          {path.string(), common::ErrorCode::Io, "Failed walking directory: " + ec.message()});
    }
    std::sort(children.begin(), children.end());
    gathered.files.insert(gathered.files.end(), children.begin(), children.end());
  }
  return gathered;
}

bool is_valid_utf8(const std::string &text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t extra = 0;
    if (lead < 0x80) {
      extra = 0;
    } else if ((lead & 0xE0) == 0xC0 && lead >= 0xC2) {
      extra = 1;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
    } else if ((lead & 0xF8) == 0xF0 && lead <= 0xF4) {
      extra = 3;
    } else {
      return false;
    }
    if (extra > 0 && i + extra >= text.size()) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
        return false;
      }
    }
    i += extra + 1;
  }
  return true;
}

} // namespace nexarag::ingest
