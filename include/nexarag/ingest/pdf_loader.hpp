#pragma once

#include "nexarag/common/result.hpp"

#include <filesystem>
#include <string>

namespace nexarag::ingest {

[[nodiscard]] common::Result<std::string> extract_pdf_text(const std::filesystem::path &path);

} // namespace nexarag::ingest
