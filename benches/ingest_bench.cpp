#include "bench_common.hpp"

#include "nexarag/embedding/local_embedder.hpp"
#include "nexarag/ingest/chunker.hpp"

#include <string>
#include <vector>

namespace {

std::string make_document(std::size_t words) {
  static const std::vector<std::string> vocabulary = {
      "deploy", "release", "rollback", "service", "config", "backup", "restore", "cluster",
      "node",   "latency", "alert",    "runbook", "token",  "index",  "query",   "cache"};
  std::string text;
  text.reserve(words * 8);
  for (std::size_t i = 0; i < words; ++i) {
    text += vocabulary[(i * 7 + i / 13) % vocabulary.size()];
    text += (i % 17 == 16) ? ".\n" : " ";
  }
  return text;
}

} // namespace

void run_ingest_benchmark() {
  const std::string document = make_document(20'000);
  const nexarag::ingest::ChunkingOptions options{.chunk_size = 400, .overlap = 80};

  nexarag::bench::run_bench("chunk_20k_words", 200,
                            [&] { (void)nexarag::ingest::chunk_text(document, options); });

  auto chunks = nexarag::ingest::chunk_text(document, options);
  if (!chunks.ok()) {
    std::cerr << "chunking failed: " << chunks.error() << "\n";
    return;
  }
  std::vector<std::string> texts;
  for (const auto &chunk : chunks.value()) {
    texts.push_back(chunk.text);
  }

  nexarag::embedding::LocalEmbedder embedder(384);
  nexarag::bench::run_bench("local_embed_query", 5000,
                            [&] { (void)embedder.embed("How do I roll back a release?"); });
  nexarag::bench::run_bench("local_embed_batch_" + std::to_string(texts.size()), 50,
                            [&] { (void)embedder.embed_batch(texts); });
}
