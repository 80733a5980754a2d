#pragma once

#include "nexarag/embedding/embedder.hpp"
#include "nexarag/index/vector_index.hpp"
#include "nexarag/store/document_catalog.hpp"

#include <memory>
#include <string>
#include <vector>

namespace nexarag::rag {

enum class RetrievalDecision {
  Accept,
  NoRelevantContext,
};

struct RetrievedChunk {
  std::string chunk_id;
  std::string document_id;
  std::string source_path;
  std::string text;
  double score = 0.0;
};

struct QueryContext {
  RetrievalDecision decision = RetrievalDecision::NoRelevantContext;
  std::vector<RetrievedChunk> chunks;
  std::string context;
  std::size_t candidates = 0;
  bool truncated = false;
};

struct RetrievalOptions {
  std::size_t top_k = 4;
  double similarity_threshold = 0.35;
  std::size_t max_context_chars = 6000;
};

inline constexpr const char *kContextSeparator = "\n---\n";

class RetrievalPipeline {
public:
  RetrievalPipeline(std::shared_ptr<embedding::IEmbedder> embedder,
                    std::shared_ptr<index::IVectorIndex> index,
                    std::shared_ptr<store::DocumentCatalog> catalog, RetrievalOptions options);

  [[nodiscard]] common::Result<QueryContext> retrieve(const std::string &query) const;

  [[nodiscard]] common::Result<QueryContext> retrieve(const std::string &query, std::size_t k,
                                                      double threshold) const;

  [[nodiscard]] const RetrievalOptions &options() const { return options_; }

private:
  std::shared_ptr<embedding::IEmbedder> embedder_;
  std::shared_ptr<index::IVectorIndex> index_;
  std::shared_ptr<store::DocumentCatalog> catalog_;
  RetrievalOptions options_;
};

std::size_t assemble_context(const std::vector<RetrievedChunk> &ranked, std::size_t max_chars,
                             std::string &out);

} // namespace nexarag::rag
