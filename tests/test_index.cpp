#include "test_framework.hpp"

#include "nexarag/index/flat_index.hpp"
#include "nexarag/index/qdrant_index.hpp"
#include "nexarag/store/document_catalog.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <limits>
#include <thread>

namespace {

namespace common = nexarag::common;
namespace vec = nexarag::index;
using nexarag::testing::http_ok;
using nexarag::testing::http_status;
using nexarag::testing::MockHttpClient;
using nexarag::testing::RecordedRequest;

vec::VectorEntry entry(const std::string &chunk_id, const std::string &document_id,
                         std::vector<float> vector) {
  return vec::VectorEntry{
      .chunk_id = chunk_id, .document_id = document_id, .vector = std::move(vector)};
}

// Replays a fixed list, optionally pausing between entries.
class ListSource final : public vec::VectorSource {
public:
  explicit ListSource(std::vector<vec::VectorEntry> entries,
                      std::chrono::microseconds pause = std::chrono::microseconds(0))
      : entries_(std::move(entries)), pause_(pause) {}

  [[nodiscard]] common::Status for_each_vector(const Visitor &visit) const override {
    for (auto copy : entries_) {
      if (pause_.count() > 0) {
        std::this_thread::sleep_for(pause_);
      }
      if (auto status = visit(std::move(copy)); !status.ok()) {
        return status;
      }
    }
    return common::Status::success();
  }

private:
  std::vector<vec::VectorEntry> entries_;
  std::chrono::microseconds pause_;
};

std::size_t entry_count(const vec::IVectorIndex &idx) { return idx.stats().value().entry_count; }

std::string aliases_body(const std::string &alias, const std::string &collection) {
  return R"({"result":{"aliases":[{"alias_name":")" + alias + R"(","collection_name":")" +
         collection + R"("}]},"status":"ok"})";
}

std::string collection_info_body(std::size_t size) {
  return R"({"result":{"status":"green","config":{"params":{"vectors":{"size":)" +
         std::to_string(size) + R"(,"distance":"Cosine"}}}}})";
}

vec::QdrantOptions qdrant_options() {
  return vec::QdrantOptions{.base_url = "http://qdrant:6333/",
                              .api_key = "secret",
                              .collection = "nexa_support",
                              .timeout_ms = 1000};
}

// Qdrant double whose alias currently points at `nexa_support_g3`.
MockHttpClient::Handler existing_collection_handler(std::size_t dimension) {
  return [dimension](const RecordedRequest &request) {
    if (request.method == "GET" && request.url == "http://qdrant:6333/aliases") {
      return http_ok(aliases_body("nexa_support", "nexa_support_g3"));
    }
    if (request.method == "GET" && request.url == "http://qdrant:6333/collections/nexa_support") {
      return http_ok(collection_info_body(dimension));
    }
    if (request.url.find("/points/count") != std::string::npos) {
      return http_ok(R"({"result":{"count":2},"status":"ok"})");
    }
    return http_ok(R"({"result":true,"status":"ok"})");
  };
}

} // namespace

void register_index_tests(std::vector<nexarag::tests::TestCase> &tests) {
  using nexarag::tests::require;

  tests.push_back({"flat_search_orders_by_descending_cosine", [] {
                     vec::FlatVectorIndex idx(3, nullptr);
                     require(idx.add({entry("a", "d1", {1.0F, 0.0F, 0.0F}),
                                      entry("b", "d1", {1.0F, 1.0F, 0.0F}),
                                      entry("c", "d2", {0.0F, 0.0F, 5.0F}),
                                      entry("d", "d2", {-2.0F, 0.0F, 0.0F})})
                                 .ok(),
                             "add succeeds");
                     const auto hits = idx.search({3.0F, 0.0F, 0.0F}, 10);
                     require(hits.ok(), hits.error());
                     require(hits.value().size() == 4, "all entries returned");
                     require(hits.value()[0].chunk_id == "a", "exact match first");
                     require(std::fabs(hits.value()[0].score - 1.0) < 1e-6, "cosine of 1");
                     require(std::fabs(hits.value()[1].score - std::sqrt(0.5)) < 1e-6,
                             "norm-independent cosine");
                     require(hits.value()[3].chunk_id == "d", "opposite vector last");
                     require(std::fabs(hits.value()[3].score + 1.0) < 1e-6, "cosine of -1");
                     for (std::size_t i = 1; i < hits.value().size(); ++i) {
                       require(hits.value()[i - 1].score >= hits.value()[i].score,
                               "scores non-increasing");
                       require(hits.value()[i].score >= -1.0 && hits.value()[i].score <= 1.0,
                               "scores bounded");
                     }
                   }});

  tests.push_back({"flat_search_respects_k", [] {
                     vec::FlatVectorIndex idx(2, nullptr);
                     std::vector<vec::VectorEntry> entries;
                     for (int i = 0; i < 20; ++i) {
                       entries.push_back(entry("c" + std::to_string(i), "d",
                                               {1.0F, static_cast<float>(i)}));
                     }
                     require(idx.add(std::move(entries)).ok(), "add succeeds");
                     require(idx.search({1.0F, 0.0F}, 5).value().size() == 5, "k bounds results");
                     require(idx.search({1.0F, 0.0F}, 0).value().empty(), "k of zero is empty");
                   }});

  tests.push_back({"flat_ties_break_by_insertion_order", [] {
                     vec::FlatVectorIndex idx(2, nullptr);
                     require(idx.add({entry("late-name", "d1", {0.0F, 1.0F})}).ok(), "first add");
                     require(idx.add({entry("early-name", "d2", {0.0F, 2.0F})}).ok(), "second add");
                     require(idx.add({entry("a-third", "d3", {0.0F, 3.0F})}).ok(), "third add");
                     const auto hits = idx.search({0.0F, 1.0F}, 3);
                     require(hits.ok(), hits.error());
                     require(hits.value()[0].chunk_id == "late-name", "earliest insert wins");
                     require(hits.value()[1].chunk_id == "early-name", "second insert next");
                     require(hits.value()[2].chunk_id == "a-third", "latest insert last");
                     require(hits.value()[0].seq < hits.value()[1].seq, "seq reflects order");
                   }});

  tests.push_back({"flat_rejects_dimension_mismatch_for_whole_batch", [] {
                     vec::FlatVectorIndex idx(3, nullptr);
                     const auto status = idx.add({entry("ok", "d", {1.0F, 0.0F, 0.0F}),
                                                  entry("bad", "d", {1.0F, 0.0F})});
                     require(!status.ok(), "mismatched batch rejected");
                     require(status.code() == common::ErrorCode::IndexIncompatible,
                             "index incompatible code");
                     require(entry_count(idx) == 0, "nothing added");
                     const auto query = idx.search({1.0F}, 1);
                     require(!query.ok() && query.code() == common::ErrorCode::IndexIncompatible,
                             "query dimension checked");
                   }});

  tests.push_back({"flat_rejects_non_finite_values", [] {
                     vec::FlatVectorIndex idx(2, nullptr);
                     const auto status =
                         idx.add({entry("nan", "d", {std::numeric_limits<float>::quiet_NaN(), 0.0F})});
                     require(status.code() == common::ErrorCode::IndexIncompatible, "nan rejected");
                   }});

  tests.push_back({"flat_skips_live_duplicate_chunk_ids", [] {
                     vec::FlatVectorIndex idx(2, nullptr);
                     require(idx.add({entry("c1", "d", {1.0F, 0.0F})}).ok(), "first add");
                     require(idx.add({entry("c1", "d", {0.0F, 1.0F}), entry("c2", "d", {0.0F, 1.0F})})
                                 .ok(),
                             "second add");
                     require(entry_count(idx) == 2, "duplicate skipped");
                     const auto hits = idx.search({1.0F, 0.0F}, 1);
                     require(hits.value()[0].chunk_id == "c1" && hits.value()[0].score > 0.99,
                             "original vector kept");
                   }});

  tests.push_back({"flat_remove_hides_document_entries", [] {
                     vec::FlatVectorIndex idx(2, nullptr);
                     require(idx.add({entry("a1", "a", {1.0F, 0.0F}), entry("a2", "a", {1.0F, 0.1F}),
                                      entry("b1", "b", {0.9F, 0.1F})})
                                 .ok(),
                             "add succeeds");
                     require(idx.remove("a").ok(), "remove succeeds");
                     require(entry_count(idx) == 1, "entry count excludes removed entries");
                     const auto hits = idx.search({1.0F, 0.0F}, 10);
                     require(hits.value().size() == 1 && hits.value()[0].document_id == "b",
                             "removed document never returned");
                     require(idx.remove("a").ok(), "removing again is harmless");
                     require(idx.remove("unknown").ok(), "unknown document is harmless");
                   }});

  tests.push_back({"flat_rebuild_without_source_compacts", [] {
                     vec::FlatVectorIndex idx(2, nullptr);
                     require(idx.add({entry("a1", "a", {1.0F, 0.0F}), entry("b1", "b", {0.0F, 1.0F})})
                                 .ok(),
                             "add succeeds");
                     require(idx.remove("a").ok(), "remove succeeds");
                     const auto before = idx.stats().value();
                     require(idx.rebuild().ok(), "rebuild succeeds");
                     const auto after = idx.stats().value();
                     require(after.entry_count == 1, "live entries kept");
                     require(after.generation == before.generation + 1, "new generation");
                     require(idx.search({0.0F, 1.0F}, 1).value()[0].chunk_id == "b1", "still searchable");
                   }});

  tests.push_back({"flat_rebuild_replays_source", [] {
                     auto source = std::make_shared<ListSource>(std::vector<vec::VectorEntry>{
                         entry("s1", "doc", {1.0F, 0.0F}), entry("s2", "doc", {0.0F, 1.0F})});
                     vec::FlatVectorIndex idx(2, source);
                     require(idx.add({entry("stale", "old", {1.0F, 1.0F})}).ok(), "stale entry");
                     require(idx.rebuild().ok(), "rebuild succeeds");
                     require(entry_count(idx) == 2, "only source entries remain");
                     const auto hits = idx.search({1.0F, 0.0F}, 5);
                     for (const auto &hit : hits.value()) {
                       require(hit.chunk_id != "stale", "stale entry dropped");
                     }
                     require(idx.remove("doc").ok(), "replayed entries are removable");
                     require(entry_count(idx) == 0, "replayed entries tracked per document");
                   }});

  tests.push_back({"flat_failed_rebuild_keeps_current_generation", [] {
                     auto source = std::make_shared<ListSource>(std::vector<vec::VectorEntry>{
                         entry("s1", "doc", {1.0F, 0.0F}), entry("bad", "doc", {1.0F, 0.0F, 0.0F})});
                     vec::FlatVectorIndex idx(2, source);
                     require(idx.add({entry("live", "d", {1.0F, 0.0F})}).ok(), "live entry");
                     const auto generation = idx.stats().value().generation;
                     const auto status = idx.rebuild();
                     require(status.code() == common::ErrorCode::IndexIncompatible,
                             "bad stored vector fails rebuild");
                     require(idx.stats().value().generation == generation, "generation unchanged");
                     require(entry_count(idx) == 1, "entries unchanged");
                   }});

  tests.push_back({"flat_clear_is_idempotent", [] {
                     vec::FlatVectorIndex idx(2, nullptr);
                     require(idx.add({entry("a", "d", {1.0F, 0.0F})}).ok(), "add");
                     require(idx.clear().ok(), "first clear");
                     require(idx.clear().ok(), "second clear");
                     require(entry_count(idx) == 0, "index empty");
                     require(idx.search({1.0F, 0.0F}, 3).value().empty(), "no hits");
                     require(idx.add({entry("a", "d", {1.0F, 0.0F})}).ok(), "re-add after clear");
                     require(entry_count(idx) == 1, "chunk id usable again");
                   }});

  tests.push_back({"flat_search_during_rebuild_sees_one_generation", [] {
                     constexpr std::size_t kOld = 40;
                     constexpr std::size_t kNew = 60;
                     std::vector<vec::VectorEntry> replay;
                     for (std::size_t i = 0; i < kNew; ++i) {
                       replay.push_back(entry("new-" + std::to_string(i), "new",
                                              {1.0F, static_cast<float>(i % 7)}));
                     }
                     auto source =
                         std::make_shared<ListSource>(std::move(replay), std::chrono::microseconds(200));
                     vec::FlatVectorIndex idx(2, source);
                     std::vector<vec::VectorEntry> initial;
                     for (std::size_t i = 0; i < kOld; ++i) {
                       initial.push_back(entry("old-" + std::to_string(i), "old",
                                               {1.0F, static_cast<float>(i % 5)}));
                     }
                     require(idx.add(std::move(initial)).ok(), "initial add");

                     std::atomic<bool> done{false};
                     std::atomic<bool> mixed{false};
                     std::atomic<bool> bad_count{false};
                     std::vector<std::thread> readers;
                     for (int r = 0; r < 3; ++r) {
                       readers.emplace_back([&] {
                         while (!done.load()) {
                           const auto hits = idx.search({1.0F, 1.0F}, 1000);
                           if (!hits.ok() || hits.value().empty()) {
                             bad_count = true;
                             continue;
                           }
                           const auto &doc = hits.value()[0].document_id;
                           for (const auto &hit : hits.value()) {
                             if (hit.document_id != doc) {
                               mixed = true;
                             }
                           }
                           const auto expected = doc == "old" ? kOld : kNew;
                           if (hits.value().size() != expected) {
                             bad_count = true;
                           }
                         }
                       });
                     }
                     const auto status = idx.rebuild();
                     std::this_thread::sleep_for(std::chrono::milliseconds(5));
                     done = true;
                     for (auto &reader : readers) {
                       reader.join();
                     }
                     require(status.ok(), status.error());
                     require(!mixed.load(), "a search mixed two generations");
                     require(!bad_count.load(), "a search saw a partial generation");
                     require(entry_count(idx) == kNew, "new generation published");
                   }});

  tests.push_back({"flat_rebuild_from_catalog", [] {
                     nexarag::testing::TempWorkspace workspace;
                     auto catalog = nexarag::store::DocumentCatalog::open(workspace.path() / "c.db");
                     require(catalog.ok(), catalog.error());
                     nexarag::store::DocumentRecord doc{.id = "doc-1",
                                                        .source_path = "/docs/a.md",
                                                        .version = "",
                                                        .tags = {},
                                                        .ingested_at = "2024-01-01T00:00:00Z",
                                                        .checksum = "abc",
                                                        .chunk_count = 2,
                                                        .deleted = false};
                     std::vector<nexarag::store::ChunkRecord> chunks = {
                         {.id = "doc-1:0", .document_id = "doc-1", .ordinal = 0, .text = "alpha",
                          .start_offset = 0, .end_offset = 5, .vector = {1.0F, 0.0F}},
                         {.id = "doc-1:1", .document_id = "doc-1", .ordinal = 1, .text = "beta",
                          .start_offset = 6, .end_offset = 10, .vector = {0.0F, 1.0F}}};
                     require(catalog.value()->insert(doc, chunks).ok(), "insert");
                     vec::FlatVectorIndex idx(2, catalog.value());
                     require(idx.rebuild().ok(), "rebuild");
                     const auto hits = idx.search({0.0F, 1.0F}, 1);
                     require(hits.value()[0].chunk_id == "doc-1:1", "vectors replayed from blobs");
                     require(std::fabs(hits.value()[0].score - 1.0) < 1e-6, "vector intact");
                   }});

  tests.push_back({"create_vector_index_selects_backend", [] {
                     nexarag::config::IndexConfig config;
                     auto flat = vec::create_vector_index(config, 8, nullptr, nullptr);
                     require(flat.ok() && flat.value()->backend() == "flat", "flat by default");
                     config.backend = "qdrant";
                     auto missing_http = vec::create_vector_index(config, 8, nullptr, nullptr);
                     require(!missing_http.ok(), "qdrant needs an http client");
                     auto qdrant = vec::create_vector_index(config, 8, nullptr,
                                                              std::make_shared<MockHttpClient>());
                     require(qdrant.ok() && qdrant.value()->backend() == "qdrant", "qdrant backend");
                     config.backend = "annoy";
                     auto unknown = vec::create_vector_index(config, 8, nullptr, nullptr);
                     require(unknown.code() == common::ErrorCode::Configuration, "unknown backend");
                     config.backend = "flat";
                     auto zero = vec::create_vector_index(config, 0, nullptr, nullptr);
                     require(zero.code() == common::ErrorCode::Configuration, "zero dimension");
                   }});

  tests.push_back({"qdrant_point_ids_are_deterministic_uuids", [] {
                     const auto id = vec::qdrant_point_id("doc-1:0");
                     require(id == vec::qdrant_point_id("doc-1:0"), "stable");
                     require(id != vec::qdrant_point_id("doc-1:1"), "distinct per chunk");
                     require(id.size() == 36 && id[8] == '-' && id[13] == '-' && id[23] == '-',
                             "uuid layout");
                   }});

  tests.push_back({"qdrant_first_use_creates_generation_and_alias", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->set_handler([](const RecordedRequest &request) {
                       if (request.method == "GET" && request.url.ends_with("/aliases")) {
                         return http_ok(R"({"result":{"aliases":[]},"status":"ok"})");
                       }
                       return http_ok(R"({"result":true,"status":"ok"})");
                     });
                     vec::QdrantVectorIndex idx(qdrant_options(), 2, nullptr, http);
                     require(idx.add({entry("doc-1:0", "doc-1", {1.0F, 0.0F})}).ok(), "add");

                     require(http->count("PUT", "/collections/nexa_support_g1") == 1,
                             "generation 1 collection created");
                     require(http->count("POST", "/collections/aliases") == 1, "alias created");
                     const auto requests = http->requests();
                     const auto &upsert = requests.back();
                     require(upsert.method == "PUT" &&
                                 upsert.url ==
                                     "http://qdrant:6333/collections/nexa_support/points?wait=true",
                             "points written through the alias");
                     require(upsert.body.find(vec::qdrant_point_id("doc-1:0")) != std::string::npos,
                             "point id derived from chunk id");
                     require(upsert.body.find(R"("document_id":"doc-1")") != std::string::npos,
                             "document id in payload");
                     require(upsert.headers.at("api-key") == "secret", "api key header");
                     const auto &create = requests[1];
                     require(create.body.find(R"("size":2)") != std::string::npos &&
                                 create.body.find("Cosine") != std::string::npos,
                             "collection sized to the embedder with cosine distance");
                   }});

  tests.push_back({"qdrant_rejects_collection_of_other_dimension", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->set_handler(existing_collection_handler(768));
                     vec::QdrantVectorIndex idx(qdrant_options(), 384, nullptr, http);
                     const auto hits = idx.search(std::vector<float>(384, 0.1F), 3);
                     require(!hits.ok(), "mismatched collection rejected");
                     require(hits.code() == common::ErrorCode::IndexIncompatible,
                             "index incompatible code");
                   }});

  tests.push_back({"qdrant_search_parses_hits_and_breaks_ties", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     const auto base = existing_collection_handler(2);
                     http->set_handler([base](const RecordedRequest &request) {
                       if (request.url.ends_with("/points/search")) {
                         return http_ok(
                             R"({"result":[)"
                             R"({"id":"x","version":1,"score":0.8,"payload":{"chunk_id":"late","document_id":"d","seq":9}},)"
                             R"({"id":"y","version":1,"score":0.8,"payload":{"chunk_id":"early","document_id":"d","seq":2}},)"
                             R"({"id":"z","version":1,"score":0.95,"payload":{"chunk_id":"best","document_id":"e","seq":7}}],"status":"ok"})");
                       }
                       return base(request);
                     });
                     vec::QdrantVectorIndex idx(qdrant_options(), 2, nullptr, http);
                     const auto hits = idx.search({1.0F, 0.0F}, 3);
                     require(hits.ok(), hits.error());
                     require(hits.value().size() == 3, "three hits");
                     require(hits.value()[0].chunk_id == "best", "highest score first");
                     require(hits.value()[1].chunk_id == "early", "tie broken by insertion seq");
                     require(hits.value()[2].chunk_id == "late", "later insert last");
                     const auto requests = http->requests();
                     require(requests.back().body.find(R"("limit":3)") != std::string::npos,
                             "k sent as limit");
                   }});

  tests.push_back({"qdrant_remove_filters_by_document", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->set_handler(existing_collection_handler(2));
                     vec::QdrantVectorIndex idx(qdrant_options(), 2, nullptr, http);
                     require(idx.remove("doc-9").ok(), "remove succeeds");
                     const auto requests = http->requests();
                     require(requests.back().url.ends_with("/collections/nexa_support/points/delete?wait=true"),
                             "delete endpoint");
                     require(requests.back().body.find(R"("value":"doc-9")") != std::string::npos,
                             "document filter");
                   }});

  tests.push_back({"qdrant_rebuild_swaps_alias_to_new_generation", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->set_handler(existing_collection_handler(2));
                     auto source = std::make_shared<ListSource>(std::vector<vec::VectorEntry>{
                         entry("a:0", "a", {1.0F, 0.0F}), entry("a:1", "a", {0.0F, 1.0F})});
                     vec::QdrantVectorIndex idx(qdrant_options(), 2, source, http);
                     require(idx.rebuild().ok(), "rebuild succeeds");

                     require(http->count("PUT", "/collections/nexa_support_g4") == 2,
                             "next generation created and filled");
                     require(http->count("PUT", "/collections/nexa_support_g4/points") == 1,
                             "vectors replayed into the new generation");
                     require(http->count("DELETE", "/collections/nexa_support_g3") == 1,
                             "old generation dropped");
                     bool swapped = false;
                     for (const auto &request : http->requests()) {
                       if (request.url.ends_with("/collections/aliases")) {
                         swapped = request.body.find("delete_alias") != std::string::npos &&
                                   request.body.find("nexa_support_g4") != std::string::npos;
                       }
                     }
                     require(swapped, "alias switched in one request");
                     const auto stats = idx.stats();
                     require(stats.ok(), stats.error());
                     require(stats.value().generation == 4, "generation advanced");
                     require(stats.value().entry_count == 2, "count from the collection");
                   }});

  tests.push_back({"qdrant_failed_rebuild_keeps_alias", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     const auto base = existing_collection_handler(2);
                     http->set_handler([base](const RecordedRequest &request) {
                       if (request.method == "PUT" &&
                           request.url.find("nexa_support_g4/points") != std::string::npos) {
                         return http_status(500, "boom");
                       }
                       return base(request);
                     });
                     auto source = std::make_shared<ListSource>(
                         std::vector<vec::VectorEntry>{entry("a:0", "a", {1.0F, 0.0F})});
                     vec::QdrantVectorIndex idx(qdrant_options(), 2, source, http);
                     const auto status = idx.rebuild();
                     require(!status.ok(), "rebuild fails");
                     require(http->count("POST", "/collections/aliases") == 0, "alias untouched");
                     require(http->count("DELETE", "/collections/nexa_support_g4") == 1,
                             "partial generation dropped");
                     require(idx.stats().value().generation == 3, "old generation still current");
                   }});

  tests.push_back({"qdrant_clear_swaps_to_empty_generation", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->set_handler(existing_collection_handler(2));
                     vec::QdrantVectorIndex idx(qdrant_options(), 2, nullptr, http);
                     require(idx.clear().ok(), "clear succeeds");
                     require(http->count("PUT", "/collections/nexa_support_g4") == 1,
                             "empty generation created");
                     require(http->count("PUT", "/points") == 0, "nothing upserted");
                     require(http->count("DELETE", "/collections/nexa_support_g3") == 1,
                             "old generation dropped");
                   }});

  tests.push_back({"qdrant_unreachable_server_is_retryable", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->set_handler([](const RecordedRequest &) {
                       nexarag::providers::HttpResponse response;
                       response.network_error = true;
                       response.network_error_message = "connection refused";
                       return response;
                     });
                     vec::QdrantVectorIndex idx(qdrant_options(), 2, nullptr, http);
                     const auto stats = idx.stats();
                     require(!stats.ok(), "stats fails");
                     require(stats.code() == common::ErrorCode::Unavailable, "transport failure code");
                   }});
}
