#include "nexarag/index/flat_index.hpp"

#include "nexarag/common/time.hpp"
#include "nexarag/observability/global.hpp"

#include <algorithm>
#include <cmath>

namespace nexarag::index {

FlatVectorIndex::FlatVectorIndex(const std::size_t dimension,
                                 std::shared_ptr<const VectorSource> source)
    : dimension_(dimension), source_(std::move(source)) {
  auto initial = std::make_shared<Generation>();
  initial->number = 1;
  initial->built_at = common::now_rfc3339();
  generation_ = std::move(initial);
}

std::shared_ptr<const FlatVectorIndex::Generation> FlatVectorIndex::current() const {
  std::lock_guard<std::mutex> lock(swap_mutex_);
  return generation_;
}

void FlatVectorIndex::publish(std::shared_ptr<const Generation> next, const char *reason) {
  const auto number = next->number;
  const auto entries = next->live_count;
  {
    std::lock_guard<std::mutex> lock(swap_mutex_);
    generation_ = std::move(next);
  }
  if (reason != nullptr) {
    observability::record_index_swap("flat", reason, number, entries);
  } else {
    observability::record_metric(observability::IndexSizeMetric{.entries = entries});
  }
}

common::Status FlatVectorIndex::check_vector(const std::vector<float> &values) const {
  if (values.size() != dimension_) {
    return common::Status::error(common::ErrorCode::IndexIncompatible,
                                 "vector has " + std::to_string(values.size()) +
                                     " dimensions; index dimension is " +
                                     std::to_string(dimension_));
  }
  for (const float v : values) {
    if (!std::isfinite(v)) {
      return common::Status::error(common::ErrorCode::IndexIncompatible,
                                   "vector contains non-finite values");
    }
  }
  return common::Status::success();
}

void FlatVectorIndex::append(WriterState &state, Segment &segment, VectorEntry &&entry) const {
  if (state.live_chunks.contains(entry.chunk_id)) {
    return;
  }
  StoredEntry stored;
  double norm = 0.0;
  stored.unit = normalized(entry.vector, &norm);
  stored.norm = static_cast<float>(norm);
  stored.seq = state.next_seq++;
  stored.chunk_id = std::move(entry.chunk_id);
  stored.document_id = std::move(entry.document_id);

  state.live_chunks.emplace(stored.chunk_id, stored.seq);
  state.document_chunks[stored.document_id].push_back(stored.chunk_id);
  segment.push_back(std::move(stored));
}

common::Status FlatVectorIndex::add(std::vector<VectorEntry> entries) {
  for (const auto &entry : entries) {
    if (auto status = check_vector(entry.vector); !status.ok()) {
      return common::Status::error(status.code(), "chunk " + entry.chunk_id + ": " + status.error());
    }
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  auto segment = std::make_shared<Segment>();
  segment->reserve(entries.size());
  for (auto &entry : entries) {
    append(writer_, *segment, std::move(entry));
  }
  if (segment->empty()) {
    return common::Status::success();
  }

  auto next = std::make_shared<Generation>(*current());
  next->live_count += segment->size();
  next->segments.push_back(std::move(segment));
  publish(std::move(next), nullptr);
  return common::Status::success();
}

common::Status FlatVectorIndex::remove(const std::string &document_id) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  const auto it = writer_.document_chunks.find(document_id);
  if (it == writer_.document_chunks.end()) {
    return common::Status::success();
  }

  auto next = std::make_shared<Generation>(*current());
  for (const auto &chunk_id : it->second) {
    const auto live = writer_.live_chunks.find(chunk_id);
    if (live == writer_.live_chunks.end()) {
      continue;
    }
    next->tombstones.insert(live->second);
    --next->live_count;
    writer_.live_chunks.erase(live);
  }
  writer_.document_chunks.erase(it);
  publish(std::move(next), nullptr);
  return common::Status::success();
}

common::Status FlatVectorIndex::rebuild() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  const auto base = current();

  WriterState state;
  auto segment = std::make_shared<Segment>();
  if (source_ != nullptr) {
    auto replayed = source_->for_each_vector([&](VectorEntry &&entry) {
      if (auto status = check_vector(entry.vector); !status.ok()) {
        return common::Status::error(status.code(),
                                     "stored chunk " + entry.chunk_id + ": " + status.error());
      }
      append(state, *segment, std::move(entry));
      return common::Status::success();
    });
    if (!replayed.ok()) {
      return replayed;
    }
  } else {
    // No canonical store: compact the live entries of the current generation.
    for (const auto &old_segment : base->segments) {
      for (const auto &stored : *old_segment) {
        if (base->tombstones.contains(stored.seq)) {
          continue;
        }
        append(state, *segment,
               VectorEntry{.chunk_id = stored.chunk_id,
                           .document_id = stored.document_id,
                           .vector = stored.unit});
      }
    }
  }

  auto next = std::make_shared<Generation>();
  next->number = base->number + 1;
  next->live_count = segment->size();
  next->built_at = common::now_rfc3339();
  if (!segment->empty()) {
    next->segments.push_back(std::move(segment));
  }
  writer_ = std::move(state);
  publish(std::move(next), "rebuild");
  return common::Status::success();
}

common::Status FlatVectorIndex::clear() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  auto next = std::make_shared<Generation>();
  next->number = current()->number + 1;
  next->built_at = common::now_rfc3339();
  writer_ = WriterState{};
  publish(std::move(next), "clear");
  return common::Status::success();
}

common::Result<std::vector<SearchHit>> FlatVectorIndex::search(const std::vector<float> &query,
                                                               const std::size_t k) const {
  using SearchResult = common::Result<std::vector<SearchHit>>;
  if (auto status = check_vector(query); !status.ok()) {
    return SearchResult::failure(status.code(), "query " + status.error());
  }
  if (k == 0) {
    return SearchResult::success({});
  }

  const auto generation = current();
  const auto unit_query = normalized(query);

  std::vector<Candidate> candidates;
  candidates.reserve(generation->live_count);
  for (const auto &segment : generation->segments) {
    for (const auto &stored : *segment) {
      if (generation->tombstones.contains(stored.seq)) {
        continue;
      }
      const double score = std::clamp(dot(unit_query, stored.unit), -1.0, 1.0);
      candidates.push_back(Candidate{.score = score, .entry = &stored});
    }
  }

  const std::size_t take = std::min(k, candidates.size());
  std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(take),
                    candidates.end(), [](const Candidate &lhs, const Candidate &rhs) {
                      if (lhs.score != rhs.score) {
                        return lhs.score > rhs.score;
                      }
                      return lhs.entry->seq < rhs.entry->seq;
                    });

  std::vector<SearchHit> hits;
  hits.reserve(take);
  for (std::size_t i = 0; i < take; ++i) {
    const StoredEntry *stored = candidates[i].entry;
    hits.push_back(SearchHit{.chunk_id = stored->chunk_id,
                             .document_id = stored->document_id,
                             .score = candidates[i].score,
                             .seq = stored->seq});
  }
  return SearchResult::success(std::move(hits));
}

common::Result<IndexStats> FlatVectorIndex::stats() const {
  const auto generation = current();
  return common::Result<IndexStats>::success(IndexStats{.backend = "flat",
                                                        .entry_count = generation->live_count,
                                                        .dimension = dimension_,
                                                        .generation = generation->number,
                                                        .last_build_at = generation->built_at});
}

} // namespace nexarag::index
