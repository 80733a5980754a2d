#pragma once

#include "nexarag/common/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace nexarag::ingest {

// `text` is the exact source span [start_offset, end_offset).
struct TextChunk {
  std::size_t ordinal = 0;
  std::string text;
  std::size_t start_offset = 0;
  std::size_t end_offset = 0;
};

struct ChunkingOptions {
  std::size_t chunk_size = 400; // words
  std::size_t overlap = 80;     // words shared with the previous window
};

[[nodiscard]] common::Result<std::vector<TextChunk>> chunk_text(std::string_view text,
                                                                const ChunkingOptions &options);

} // namespace nexarag::ingest
