#pragma once

#include "nexarag/index/vector_index.hpp"

#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace nexarag::index {

/// In-process exact index. Each published generation is immutable: writers
/// build a new generation that shares the unchanged segments, then swap the
/// pointer under a lock held only for the swap. Searches run lock-free on the
/// generation they captured.
class FlatVectorIndex final : public IVectorIndex {
public:
  FlatVectorIndex(std::size_t dimension, std::shared_ptr<const VectorSource> source);

  [[nodiscard]] std::string_view backend() const override { return "flat"; }
  [[nodiscard]] std::size_t dimension() const override { return dimension_; }

  [[nodiscard]] common::Status add(std::vector<VectorEntry> entries) override;
  [[nodiscard]] common::Result<std::vector<SearchHit>> search(const std::vector<float> &query,
                                                              std::size_t k) const override;
  [[nodiscard]] common::Status remove(const std::string &document_id) override;
  [[nodiscard]] common::Status rebuild() override;
  [[nodiscard]] common::Status clear() override;
  [[nodiscard]] common::Result<IndexStats> stats() const override;

private:
  struct StoredEntry {
    std::string chunk_id;
    std::string document_id;
    std::vector<float> unit; // normalized vector
    float norm = 0.0F;
    std::uint64_t seq = 0;
  };

  using Segment = std::vector<StoredEntry>;

  struct Candidate {
    double score = 0.0;
    const StoredEntry *entry = nullptr;
  };

  struct Generation {
    std::uint64_t number = 0;
    std::vector<std::shared_ptr<const Segment>> segments;
    std::unordered_set<std::uint64_t> tombstones;
    std::size_t live_count = 0;
    std::string built_at;
  };

  // Writer-side bookkeeping, guarded by write_mutex_.
  struct WriterState {
    std::uint64_t next_seq = 0;
    std::unordered_map<std::string, std::uint64_t> live_chunks;
    std::unordered_map<std::string, std::vector<std::string>> document_chunks;
  };

  [[nodiscard]] std::shared_ptr<const Generation> current() const;
  void publish(std::shared_ptr<const Generation> next, const char *reason);
  [[nodiscard]] common::Status check_vector(const std::vector<float> &values) const;
  // Skips chunks that are already live.
  void append(WriterState &state, Segment &segment, VectorEntry &&entry) const;

  std::size_t dimension_;
  std::shared_ptr<const VectorSource> source_;

  mutable std::mutex swap_mutex_;
  std::shared_ptr<const Generation> generation_;

  std::mutex write_mutex_;
  WriterState writer_;
};

} // namespace nexarag::index
