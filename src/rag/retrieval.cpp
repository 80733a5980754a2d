#include "nexarag/rag/retrieval.hpp"

#include "nexarag/observability/global.hpp"

#include <cstring>
#include <unordered_map>

namespace nexarag::rag {

std::size_t assemble_context(const std::vector<RetrievedChunk> &ranked, const std::size_t max_chars,
                             std::string &out) {
  out.clear();
  const std::size_t separator = std::strlen(kContextSeparator);
  std::size_t used = 0;
  for (const auto &chunk : ranked) {
    if (used > 0 && out.size() + separator + chunk.text.size() > max_chars) {
      break;
    }
    if (used > 0) {
      out += kContextSeparator;
    }
    out += chunk.text;
    ++used;
  }
  return used;
}

RetrievalPipeline::RetrievalPipeline(std::shared_ptr<embedding::IEmbedder> embedder,
                                     std::shared_ptr<index::IVectorIndex> index,
                                     std::shared_ptr<store::DocumentCatalog> catalog,
                                     RetrievalOptions options)
    : embedder_(std::move(embedder)), index_(std::move(index)), catalog_(std::move(catalog)),
      options_(options) {}

common::Result<QueryContext> RetrievalPipeline::retrieve(const std::string &query) const {
  return retrieve(query, options_.top_k, options_.similarity_threshold);
}

common::Result<QueryContext> RetrievalPipeline::retrieve(const std::string &query,
                                                         const std::size_t k,
                                                         const double threshold) const {
  using ContextResult = common::Result<QueryContext>;
  if (k == 0) {
    return ContextResult::failure(common::ErrorCode::Configuration, "top_k must be positive");
  }
  if (threshold < -1.0 || threshold > 1.0) {
    return ContextResult::failure(common::ErrorCode::Configuration,
                                  "similarity threshold must be within [-1, 1]");
  }

  observability::ScopedLatency latency("retrieve");
  auto query_vector = embedder_->embed(query);
  if (!query_vector.ok()) {
    return query_vector.forward_error<QueryContext>();
  }
  if (auto status =
          embedding::check_dimensions(query_vector.value(), index_->dimension(), embedder_->name());
      !status.ok()) {
    return ContextResult::failure(status.code(), status.error());
  }

  auto hits = index_->search(query_vector.value(), k);
  if (!hits.ok()) {
    return hits.forward_error<QueryContext>();
  }

  std::vector<std::string> relevant_ids;
  for (const auto &hit : hits.value()) {
    if (hit.score >= threshold) {
      relevant_ids.push_back(hit.chunk_id);
    }
  }

  auto records = catalog_->get_chunks(relevant_ids);
  if (!records.ok()) {
    return records.forward_error<QueryContext>();
  }
  std::unordered_map<std::string, const store::ChunkRecord *> by_id;
  for (const auto &record : records.value()) {
    by_id.emplace(record.id, &record);
  }

  std::unordered_map<std::string, std::string> source_paths;
  std::vector<RetrievedChunk> ranked;
  for (const auto &hit : hits.value()) {
    if (hit.score < threshold) {
      continue;
    }
    // A chunk removed since the search completed is no longer citable.
    const auto found = by_id.find(hit.chunk_id);
    if (found == by_id.end()) {
      continue;
    }
    auto path = source_paths.find(hit.document_id);
    if (path == source_paths.end()) {
      auto document = catalog_->get_document(hit.document_id);
      if (!document.ok()) {
        return document.forward_error<QueryContext>();
      }
      path = source_paths
                 .emplace(hit.document_id,
                          document.value().has_value() ? document.value()->source_path : "")
                 .first;
    }
    ranked.push_back(RetrievedChunk{.chunk_id = hit.chunk_id,
                                    .document_id = hit.document_id,
                                    .source_path = path->second,
                                    .text = found->second->text,
                                    .score = hit.score});
  }

  QueryContext out;
  out.candidates = hits.value().size();
  if (!ranked.empty()) {
    const std::size_t used = assemble_context(ranked, options_.max_context_chars, out.context);
    out.truncated = used < ranked.size();
    ranked.resize(used);
    out.chunks = std::move(ranked);
    out.decision = RetrievalDecision::Accept;
  }

  observability::record_event(observability::RetrievalEvent{
      .candidates = out.candidates,
      .accepted = out.chunks.size(),
      .top_score = hits.value().empty() ? 0.0 : hits.value().front().score,
      .refused = out.decision == RetrievalDecision::NoRelevantContext});
  return ContextResult::success(std::move(out));
}

} // namespace nexarag::rag
