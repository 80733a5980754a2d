#include "nexarag/index/qdrant_index.hpp"

#include "nexarag/common/fs.hpp"
#include "nexarag/common/hash.hpp"
#include "nexarag/common/json_util.hpp"
#include "nexarag/common/time.hpp"
#include "nexarag/observability/global.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace nexarag::index {

namespace {

constexpr std::size_t kUpsertBatch = 128;

common::Status request_failure(const providers::HttpResponse &response, const std::string &what) {
  const auto error = providers::classify_response(response);
  if (!error.has_value()) {
    return common::Status::error(common::ErrorCode::Storage, "qdrant " + what + " failed");
  }
  return common::Status::error(error->error_code(common::ErrorCode::Storage),
                               "qdrant " + what + ": " + error->to_string());
}

std::string document_filter(const std::string &document_id) {
  return "{\"must\":[{\"key\":\"document_id\",\"match\":{\"value\":\"" +
         common::json_escape(document_id) + "\"}}]}";
}

std::optional<std::uint64_t> parse_generation(const std::string &collection,
                                              const std::string &prefix) {
  if (!common::starts_with(collection, prefix)) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  const char *begin = collection.data() + prefix.size();
  const char *end = collection.data() + collection.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::string qdrant_point_id(const std::string &chunk_id) {
  const std::string hex = common::sha256_hex(chunk_id);
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
         hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

QdrantVectorIndex::QdrantVectorIndex(QdrantOptions options, const std::size_t dimension,
                                     std::shared_ptr<const VectorSource> source,
                                     std::shared_ptr<providers::HttpClient> http_client)
    : options_(std::move(options)), dimension_(dimension), source_(std::move(source)),
      http_client_(std::move(http_client)),
      next_seq_(static_cast<std::uint64_t>(common::now_unix_ms()) * 1000) {
  options_.base_url = providers::strip_trailing_slashes(options_.base_url);
}

providers::HttpHeaders QdrantVectorIndex::headers() const {
  providers::HttpHeaders out;
  if (!options_.api_key.empty()) {
    out["api-key"] = options_.api_key;
  }
  return out;
}

std::string QdrantVectorIndex::collection_url(const std::string &name) const {
  return options_.base_url + "/collections/" + name;
}

std::string QdrantVectorIndex::physical_name(const std::uint64_t generation) const {
  return options_.collection + "_g" + std::to_string(generation);
}

common::Status QdrantVectorIndex::create_collection(const std::string &name) const {
  std::ostringstream body;
  body << "{\"vectors\":{\"size\":" << dimension_ << ",\"distance\":\"Cosine\"}}";
  const auto response =
      http_client_->put_json(collection_url(name), headers(), body.str(), options_.timeout_ms);
  if (providers::classify_response(response).has_value()) {
    return request_failure(response, "create collection " + name);
  }
  return common::Status::success();
}

// Resolves the alias to its generation, creating generation 1 on first use.
common::Status QdrantVectorIndex::ensure_ready() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (ready_) {
    return common::Status::success();
  }

  const auto aliases = http_client_->get(options_.base_url + "/aliases", headers(),
                                         options_.timeout_ms);
  if (providers::classify_response(aliases).has_value()) {
    return request_failure(aliases, "list aliases");
  }

  std::optional<std::uint64_t> generation;
  const std::string result = common::json_get_object(aliases.body, "result");
  for (const auto &item :
       common::json_split_top_level_objects(common::json_get_array(result, "aliases"))) {
    if (common::json_get_string(item, "alias_name") != options_.collection) {
      continue;
    }
    generation = parse_generation(common::json_get_string(item, "collection_name"),
                                  options_.collection + "_g");
    break;
  }

  if (!generation.has_value()) {
    const std::string name = physical_name(1);
    if (auto status = create_collection(name); !status.ok()) {
      return status;
    }
    const std::string actions = "{\"actions\":[{\"create_alias\":{\"collection_name\":\"" +
                                common::json_escape(name) + "\",\"alias_name\":\"" +
                                common::json_escape(options_.collection) + "\"}}]}";
    const auto created = http_client_->post_json(options_.base_url + "/collections/aliases",
                                                 headers(), actions, options_.timeout_ms);
    if (providers::classify_response(created).has_value()) {
      return request_failure(created, "create alias");
    }
    generation = 1;
  } else {
    const auto info = http_client_->get(collection_url(options_.collection), headers(),
                                        options_.timeout_ms);
    if (providers::classify_response(info).has_value()) {
      return request_failure(info, "collection info");
    }
    const std::string vectors = common::json_get_object(
        common::json_get_object(
            common::json_get_object(common::json_get_object(info.body, "result"), "config"),
            "params"),
        "vectors");
    const std::string size = common::json_get_number(vectors, "size");
    if (!size.empty() && std::strtoull(size.c_str(), nullptr, 10) != dimension_) {
      return common::Status::error(common::ErrorCode::IndexIncompatible,
                                   "qdrant collection " + options_.collection + " has dimension " +
                                       size + "; embedder produces " +
                                       std::to_string(dimension_));
    }
  }

  generation_ = *generation;
  built_at_ = common::now_rfc3339();
  ready_ = true;
  return common::Status::success();
}

common::Status QdrantVectorIndex::upsert(const std::string &collection,
                                         std::vector<VectorEntry> entries) {
  for (std::size_t begin = 0; begin < entries.size(); begin += kUpsertBatch) {
    const std::size_t end = std::min(begin + kUpsertBatch, entries.size());
    std::ostringstream body;
    body << "{\"points\":[";
    for (std::size_t i = begin; i < end; ++i) {
      const auto &entry = entries[i];
      if (i > begin) {
        body << ',';
      }
      body << "{\"id\":\"" << qdrant_point_id(entry.chunk_id) << "\",";
      body << "\"vector\":" << common::json_float_array(entry.vector) << ',';
      body << "\"payload\":{\"chunk_id\":\"" << common::json_escape(entry.chunk_id) << "\",";
      body << "\"document_id\":\"" << common::json_escape(entry.document_id) << "\",";
      body << "\"seq\":" << next_seq_.fetch_add(1) << "}}";
    }
    body << "]}";
    const auto response = http_client_->put_json(collection_url(collection) + "/points?wait=true",
                                                 headers(), body.str(), options_.timeout_ms);
    if (providers::classify_response(response).has_value()) {
      return request_failure(response, "upsert");
    }
  }
  return common::Status::success();
}

common::Status QdrantVectorIndex::add(std::vector<VectorEntry> entries) {
  for (const auto &entry : entries) {
    if (entry.vector.size() != dimension_) {
      return common::Status::error(common::ErrorCode::IndexIncompatible,
                                   "chunk " + entry.chunk_id + ": vector has " +
                                       std::to_string(entry.vector.size()) +
                                       " dimensions; index dimension is " +
                                       std::to_string(dimension_));
    }
  }
  if (entries.empty()) {
    return common::Status::success();
  }
  if (auto status = ensure_ready(); !status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(write_mutex_);
  // Point ids derive from chunk ids, so re-adding a live chunk overwrites it.
  return upsert(options_.collection, std::move(entries));
}

common::Status QdrantVectorIndex::remove(const std::string &document_id) {
  if (auto status = ensure_ready(); !status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(write_mutex_);
  const std::string body = "{\"filter\":" + document_filter(document_id) + "}";
  const auto response =
      http_client_->post_json(collection_url(options_.collection) + "/points/delete?wait=true",
                              headers(), body, options_.timeout_ms);
  if (providers::classify_response(response).has_value()) {
    return request_failure(response, "delete");
  }
  return common::Status::success();
}

common::Result<std::vector<SearchHit>> QdrantVectorIndex::search(const std::vector<float> &query,
                                                                 const std::size_t k) const {
  using SearchResult = common::Result<std::vector<SearchHit>>;
  if (query.size() != dimension_) {
    return SearchResult::failure(common::ErrorCode::IndexIncompatible,
                                 "query vector has " + std::to_string(query.size()) +
                                     " dimensions; index dimension is " +
                                     std::to_string(dimension_));
  }
  if (k == 0) {
    return SearchResult::success({});
  }
  if (auto status = ensure_ready(); !status.ok()) {
    return SearchResult::failure(status.code(), status.error());
  }

  std::ostringstream body;
  body << "{\"vector\":" << common::json_float_array(query) << ",\"limit\":" << k
       << ",\"with_payload\":true}";
  const auto response = http_client_->post_json(collection_url(options_.collection) +
                                                    "/points/search",
                                                headers(), body.str(), options_.timeout_ms);
  if (providers::classify_response(response).has_value()) {
    const auto status = request_failure(response, "search");
    return SearchResult::failure(status.code(), status.error());
  }

  std::vector<SearchHit> hits;
  for (const auto &item :
       common::json_split_top_level_objects(common::json_get_array(response.body, "result"))) {
    const std::string payload = common::json_get_object(item, "payload");
    SearchHit hit;
    hit.chunk_id = common::json_get_string(payload, "chunk_id");
    hit.document_id = common::json_get_string(payload, "document_id");
    hit.score = std::clamp(std::strtod(common::json_get_number(item, "score").c_str(), nullptr),
                           -1.0, 1.0);
    hit.seq = std::strtoull(common::json_get_number(payload, "seq").c_str(), nullptr, 10);
    if (hit.chunk_id.empty()) {
      return SearchResult::failure(common::ErrorCode::Storage,
                                   "qdrant search: point without chunk_id payload");
    }
    hits.push_back(std::move(hit));
  }
  std::stable_sort(hits.begin(), hits.end(), [](const SearchHit &lhs, const SearchHit &rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    return lhs.seq < rhs.seq;
  });
  if (hits.size() > k) {
    hits.resize(k);
  }
  return SearchResult::success(std::move(hits));
}

// Points the alias at a freshly filled collection and drops the old one.
common::Status QdrantVectorIndex::switch_generation(const std::uint64_t next_generation,
                                                    const char *reason) {
  std::uint64_t previous = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    previous = generation_;
  }
  const std::string alias = common::json_escape(options_.collection);
  const std::string actions = "{\"actions\":[{\"delete_alias\":{\"alias_name\":\"" + alias +
                              "\"}},{\"create_alias\":{\"collection_name\":\"" +
                              common::json_escape(physical_name(next_generation)) +
                              "\",\"alias_name\":\"" + alias + "\"}}]}";
  const auto response = http_client_->post_json(options_.base_url + "/collections/aliases",
                                                headers(), actions, options_.timeout_ms);
  if (providers::classify_response(response).has_value()) {
    return request_failure(response, "switch alias");
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    generation_ = next_generation;
    built_at_ = common::now_rfc3339();
  }

  const auto dropped =
      http_client_->del(collection_url(physical_name(previous)), headers(), options_.timeout_ms);
  if (providers::classify_response(dropped).has_value()) {
    observability::record_error("index", "qdrant: failed to drop " + physical_name(previous) +
                                             ": " + request_failure(dropped, "drop").error());
  }

  std::size_t entries = 0;
  if (auto current = stats(); current.ok()) {
    entries = current.value().entry_count;
  }
  observability::record_index_swap("qdrant", reason, next_generation, entries);
  return common::Status::success();
}

common::Status QdrantVectorIndex::rebuild() {
  if (auto status = ensure_ready(); !status.ok()) {
    return status;
  }
  if (source_ == nullptr) {
    return common::Status::error(common::ErrorCode::Configuration,
                                 "qdrant rebuild requires a canonical vector source");
  }
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::uint64_t next = 0;
  {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    next = generation_ + 1;
  }
  const std::string target = physical_name(next);
  if (auto status = create_collection(target); !status.ok()) {
    return status;
  }

  std::vector<VectorEntry> batch;
  auto replayed = source_->for_each_vector([&](VectorEntry &&entry) {
    if (entry.vector.size() != dimension_) {
      return common::Status::error(common::ErrorCode::IndexIncompatible,
                                   "stored chunk " + entry.chunk_id + " has " +
                                       std::to_string(entry.vector.size()) +
                                       " dimensions; index dimension is " +
                                       std::to_string(dimension_));
    }
    batch.push_back(std::move(entry));
    if (batch.size() < kUpsertBatch) {
      return common::Status::success();
    }
    auto status = upsert(target, std::move(batch));
    batch.clear();
    return status;
  });
  if (replayed.ok() && !batch.empty()) {
    replayed = upsert(target, std::move(batch));
  }
  if (!replayed.ok()) {
    const auto dropped =
        http_client_->del(collection_url(target), headers(), options_.timeout_ms);
    if (providers::classify_response(dropped).has_value()) {
      observability::record_error("index", "qdrant: failed to drop partial " + target);
    }
    return replayed;
  }
  return switch_generation(next, "rebuild");
}

common::Status QdrantVectorIndex::clear() {
  if (auto status = ensure_ready(); !status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::uint64_t next = 0;
  {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    next = generation_ + 1;
  }
  if (auto status = create_collection(physical_name(next)); !status.ok()) {
    return status;
  }
  return switch_generation(next, "clear");
}

common::Result<IndexStats> QdrantVectorIndex::stats() const {
  using StatsResult = common::Result<IndexStats>;
  if (auto status = ensure_ready(); !status.ok()) {
    return StatsResult::failure(status.code(), status.error());
  }
  const auto response =
      http_client_->post_json(collection_url(options_.collection) + "/points/count", headers(),
                              "{\"exact\":true}", options_.timeout_ms);
  if (providers::classify_response(response).has_value()) {
    const auto status = request_failure(response, "count");
    return StatsResult::failure(status.code(), status.error());
  }
  const std::string result = common::json_get_object(response.body, "result");
  IndexStats out;
  out.backend = "qdrant";
  out.dimension = dimension_;
  out.entry_count =
      static_cast<std::size_t>(std::strtoull(common::json_get_number(result, "count").c_str(),
                                             nullptr, 10));
  std::lock_guard<std::mutex> lock(state_mutex_);
  out.generation = generation_;
  out.last_build_at = built_at_;
  return StatsResult::success(std::move(out));
}

} // namespace nexarag::index
