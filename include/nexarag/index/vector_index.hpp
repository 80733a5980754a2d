#pragma once

#include "nexarag/common/result.hpp"
#include "nexarag/config/schema.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace nexarag::providers {
class HttpClient;
}

namespace nexarag::index {

struct VectorEntry {
  std::string chunk_id;
  std::string document_id;
  std::vector<float> vector;
};

struct SearchHit {
  std::string chunk_id;
  std::string document_id;
  double score = 0.0;
  std::uint64_t seq = 0; // insertion order within the generation
};

struct IndexStats {
  std::string backend;
  std::size_t entry_count = 0;
  std::size_t dimension = 0;
  std::uint64_t generation = 0;
  std::string last_build_at;
};

/// Canonical store the index can be rebuilt from. Vectors are replayed in
/// insertion order.
class VectorSource {
public:
  using Visitor = std::function<common::Status(VectorEntry &&entry)>;

  virtual ~VectorSource() = default;
  [[nodiscard]] virtual common::Status for_each_vector(const Visitor &visit) const = 0;
};

/// Similarity index over chunk vectors. Scores are cosine similarity in
/// [-1, 1], results are ordered by descending score with ties broken by
/// insertion order. Readers never observe a partially rebuilt generation.
class IVectorIndex {
public:
  virtual ~IVectorIndex() = default;

  [[nodiscard]] virtual std::string_view backend() const = 0;
  [[nodiscard]] virtual std::size_t dimension() const = 0;

  /// Entries whose chunk id is already live are skipped. Any dimension
  /// mismatch rejects the whole batch with IndexIncompatible.
  [[nodiscard]] virtual common::Status add(std::vector<VectorEntry> entries) = 0;
  [[nodiscard]] virtual common::Result<std::vector<SearchHit>>
  search(const std::vector<float> &query, std::size_t k) const = 0;
  [[nodiscard]] virtual common::Status remove(const std::string &document_id) = 0;
  [[nodiscard]] virtual common::Status rebuild() = 0;
  [[nodiscard]] virtual common::Status clear() = 0;
  [[nodiscard]] virtual common::Result<IndexStats> stats() const = 0;
};

/// Unit-length copy of `values` and the original L2 norm.
[[nodiscard]] std::vector<float> normalized(const std::vector<float> &values, double *norm = nullptr);

[[nodiscard]] double dot(const std::vector<float> &a, const std::vector<float> &b);

[[nodiscard]] common::Result<std::unique_ptr<IVectorIndex>>
create_vector_index(const config::IndexConfig &config, std::size_t dimension,
                    std::shared_ptr<const VectorSource> source,
                    std::shared_ptr<providers::HttpClient> http_client);

} // namespace nexarag::index
