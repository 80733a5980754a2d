#pragma once

#include "nexarag/index/vector_index.hpp"
#include "nexarag/providers/http.hpp"

#include <atomic>
#include <mutex>
#include <optional>

namespace nexarag::index {

struct QdrantOptions {
  std::string base_url = "http://localhost:6333";
  std::string api_key;
  std::string collection = "nexa_support";
  std::uint64_t timeout_ms = 10'000;
};

/// Index backed by a Qdrant server. Queries always go through the alias
/// `<collection>`, which points at a physical collection `<collection>_g<N>`.
/// Rebuild and clear fill a fresh collection and switch the alias in a single
/// atomic alias update, so readers see the old or the new generation.
class QdrantVectorIndex final : public IVectorIndex {
public:
  QdrantVectorIndex(QdrantOptions options, std::size_t dimension,
                    std::shared_ptr<const VectorSource> source,
                    std::shared_ptr<providers::HttpClient> http_client);

  [[nodiscard]] std::string_view backend() const override { return "qdrant"; }
  [[nodiscard]] std::size_t dimension() const override { return dimension_; }

  [[nodiscard]] common::Status add(std::vector<VectorEntry> entries) override;
  [[nodiscard]] common::Result<std::vector<SearchHit>> search(const std::vector<float> &query,
                                                              std::size_t k) const override;
  [[nodiscard]] common::Status remove(const std::string &document_id) override;
  [[nodiscard]] common::Status rebuild() override;
  [[nodiscard]] common::Status clear() override;
  [[nodiscard]] common::Result<IndexStats> stats() const override;

private:
  [[nodiscard]] common::Status ensure_ready() const;
  [[nodiscard]] common::Status create_collection(const std::string &name) const;
  [[nodiscard]] common::Status upsert(const std::string &collection,
                                      std::vector<VectorEntry> entries);
  [[nodiscard]] common::Status switch_generation(std::uint64_t next_generation,
                                                 const char *reason);
  [[nodiscard]] std::string collection_url(const std::string &name) const;
  [[nodiscard]] std::string physical_name(std::uint64_t generation) const;
  [[nodiscard]] providers::HttpHeaders headers() const;

  QdrantOptions options_;
  std::size_t dimension_;
  std::shared_ptr<const VectorSource> source_;
  std::shared_ptr<providers::HttpClient> http_client_;

  mutable std::mutex state_mutex_;
  mutable bool ready_ = false;
  mutable std::uint64_t generation_ = 0;
  mutable std::string built_at_;

  std::mutex write_mutex_;
  std::atomic<std::uint64_t> next_seq_;
};

[[nodiscard]] std::string qdrant_point_id(const std::string &chunk_id);

} // namespace nexarag::index
