#include "nexarag/ingest/chunker.hpp"

#include <algorithm>
#include <cctype>

namespace nexarag::ingest {

namespace {

struct WordSpan {
  std::size_t begin = 0;
  std::size_t end = 0;
};

std::vector<WordSpan> split_words(std::string_view text) {
  std::vector<WordSpan> words;
  std::size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) != 0) {
      ++i;
    }
    if (i >= text.size()) {
      break;
    }
    const std::size_t begin = i;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) == 0) {
      ++i;
    }
    words.push_back({begin, i});
  }
  return words;
}

} // namespace

common::Result<std::vector<TextChunk>> chunk_text(std::string_view text,
                                                  const ChunkingOptions &options) {
  using ChunkResult = common::Result<std::vector<TextChunk>>;
  if (options.chunk_size == 0) {
    return ChunkResult::failure(common::ErrorCode::Configuration, "chunk size must be positive");
  }
  if (options.overlap >= options.chunk_size) {
    return ChunkResult::failure(common::ErrorCode::Configuration,
                                "chunk overlap (" + std::to_string(options.overlap) +
                                    ") must be smaller than chunk size (" +
                                    std::to_string(options.chunk_size) + ")");
  }

  const auto words = split_words(text);
  std::vector<TextChunk> chunks;
  std::size_t start = 0;
  while (start < words.size()) {
    const std::size_t end = std::min(start + options.chunk_size, words.size());
    TextChunk chunk;
    chunk.ordinal = chunks.size();
    chunk.start_offset = words[start].begin;
    chunk.end_offset = words[end - 1].end;
    chunk.text = std::string(text.substr(chunk.start_offset, chunk.end_offset - chunk.start_offset));
    chunks.push_back(std::move(chunk));
    if (end == words.size()) {
      break;
    }
    start = end - options.overlap;
  }
  return ChunkResult::success(std::move(chunks));
}

} // namespace nexarag::ingest
