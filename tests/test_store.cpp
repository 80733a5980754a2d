#include "test_framework.hpp"

#include "nexarag/store/document_catalog.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cmath>

namespace {

namespace common = nexarag::common;
namespace store = nexarag::store;

store::DocumentRecord make_document(const std::string &id, const std::string &path,
                                    const std::string &ingested_at) {
  return store::DocumentRecord{.id = id,
                               .source_path = path,
                               .version = "v1",
                               .tags = {"ops", "deploy"},
                               .ingested_at = ingested_at,
                               .checksum = "sum-" + id,
                               .chunk_count = 0,
                               .deleted = false};
}

std::vector<store::ChunkRecord> make_chunks(const std::string &document_id, std::size_t count) {
  std::vector<store::ChunkRecord> chunks;
  for (std::size_t i = 0; i < count; ++i) {
    chunks.push_back(store::ChunkRecord{.id = document_id + ":" + std::to_string(i),
                                        .document_id = document_id,
                                        .ordinal = i,
                                        .text = "chunk " + std::to_string(i),
                                        .start_offset = i * 10,
                                        .end_offset = i * 10 + 7,
                                        .vector = {static_cast<float>(i), 0.5F, -1.25F}});
  }
  return chunks;
}

std::shared_ptr<store::DocumentCatalog> open_catalog(const nexarag::testing::TempWorkspace &ws) {
  auto catalog = store::DocumentCatalog::open(ws.path() / "nested" / "catalog.db");
  nexarag::tests::require(catalog.ok(), catalog.error());
  return catalog.value();
}

} // namespace

void register_store_tests(std::vector<nexarag::tests::TestCase> &tests) {
  using nexarag::tests::require;

  tests.push_back({"catalog_insert_and_lookup_document", [] {
                     nexarag::testing::TempWorkspace ws;
                     auto catalog = open_catalog(ws);
                     require(catalog->insert(make_document("doc-a", "/docs/a.md",
                                                           "2024-01-01T00:00:00Z"),
                                             make_chunks("doc-a", 3))
                                 .ok(),
                             "insert succeeds");
                     const auto found = catalog->get_document("doc-a");
                     require(found.ok() && found.value().has_value(), "document found");
                     const auto &doc = *found.value();
                     require(doc.source_path == "/docs/a.md", "path stored");
                     require(doc.version == "v1", "version stored");
                     require(doc.tags == std::vector<std::string>({"ops", "deploy"}), "tags stored");
                     require(doc.chunk_count == 3, "chunk count from chunks");
                     require(!doc.deleted, "live");
                     require(catalog->chunk_count().value() == 3, "chunks stored");
                     const auto missing = catalog->get_document("doc-x");
                     require(missing.ok() && !missing.value().has_value(), "unknown id is empty");
                   }});

  tests.push_back({"catalog_get_chunks_keeps_requested_order", [] {
                     nexarag::testing::TempWorkspace ws;
                     auto catalog = open_catalog(ws);
                     require(catalog->insert(make_document("doc-a", "/docs/a.md",
                                                           "2024-01-01T00:00:00Z"),
                                             make_chunks("doc-a", 3))
                                 .ok(),
                             "insert succeeds");
                     const auto chunks = catalog->get_chunks({"doc-a:2", "missing", "doc-a:0"});
                     require(chunks.ok(), chunks.error());
                     require(chunks.value().size() == 2, "unknown ids omitted");
                     require(chunks.value()[0].id == "doc-a:2", "requested order");
                     require(chunks.value()[0].text == "chunk 2", "text stored");
                     require(chunks.value()[0].start_offset == 20 && chunks.value()[0].end_offset == 27,
                             "offsets stored");
                     require(chunks.value()[1].ordinal == 0, "ordinal stored");
                     require(chunks.value()[1].vector.empty(), "vectors not loaded");
                   }});

  tests.push_back({"catalog_find_live_by_path_skips_deleted", [] {
                     nexarag::testing::TempWorkspace ws;
                     auto catalog = open_catalog(ws);
                     require(catalog->insert(make_document("doc-old", "/docs/a.md",
                                                           "2024-01-01T00:00:00Z"),
                                             make_chunks("doc-old", 1))
                                 .ok(),
                             "insert old");
                     require(catalog->mark_deleted("doc-old").ok(), "delete old");
                     require(catalog->insert(make_document("doc-new", "/docs/a.md",
                                                           "2024-02-01T00:00:00Z"),
                                             make_chunks("doc-new", 2))
                                 .ok(),
                             "insert new");
                     const auto live = catalog->find_live_by_path("/docs/a.md");
                     require(live.ok() && live.value().has_value(), "live document found");
                     require(live.value()->id == "doc-new", "deleted version skipped");
                     require(catalog->list_documents().value().size() == 1, "live listing");
                     require(catalog->list_documents(true).value().size() == 2, "history listing");
                     require(catalog->chunk_count().value() == 2, "deleted chunks dropped");
                   }});

  tests.push_back({"catalog_mark_deleted_unknown_is_not_found", [] {
                     nexarag::testing::TempWorkspace ws;
                     auto catalog = open_catalog(ws);
                     const auto status = catalog->mark_deleted("doc-missing");
                     require(!status.ok(), "unknown document rejected");
                     require(status.code() == common::ErrorCode::NotFound, "not found code");
                   }});

  tests.push_back({"catalog_duplicate_insert_rolls_back", [] {
                     nexarag::testing::TempWorkspace ws;
                     auto catalog = open_catalog(ws);
                     auto chunks = make_chunks("doc-a", 2);
                     chunks[1].id = chunks[0].id;
                     const auto status = catalog->insert(
                         make_document("doc-a", "/docs/a.md", "2024-01-01T00:00:00Z"), chunks);
                     require(!status.ok(), "duplicate chunk id rejected");
                     require(status.code() == common::ErrorCode::Storage, "storage code");
                     require(!catalog->get_document("doc-a").value().has_value(),
                             "document rolled back");
                     require(catalog->chunk_count().value() == 0, "chunks rolled back");
                   }});

  tests.push_back({"catalog_erase_and_clear", [] {
                     nexarag::testing::TempWorkspace ws;
                     auto catalog = open_catalog(ws);
                     require(catalog->insert(make_document("doc-a", "/docs/a.md",
                                                           "2024-01-01T00:00:00Z"),
                                             make_chunks("doc-a", 2))
                                 .ok(),
                             "insert a");
                     require(catalog->insert(make_document("doc-b", "/docs/b.md",
                                                           "2024-01-01T00:00:00Z"),
                                             make_chunks("doc-b", 2))
                                 .ok(),
                             "insert b");
                     require(catalog->erase("doc-a").ok(), "erase");
                     require(!catalog->get_document("doc-a").value().has_value(), "erased");
                     require(catalog->chunk_count().value() == 2, "erased chunks cascade");
                     require(catalog->clear().ok(), "clear");
                     require(catalog->list_documents(true).value().empty(), "no documents");
                     require(catalog->chunk_count().value() == 0, "no chunks");
                     require(catalog->clear().ok(), "clear again");
                   }});

  tests.push_back({"catalog_replays_live_vectors_in_insert_order", [] {
                     nexarag::testing::TempWorkspace ws;
                     auto catalog = open_catalog(ws);
                     require(catalog->insert(make_document("doc-a", "/docs/a.md",
                                                           "2024-01-01T00:00:00Z"),
                                             make_chunks("doc-a", 2))
                                 .ok(),
                             "insert a");
                     require(catalog->insert(make_document("doc-b", "/docs/b.md",
                                                           "2024-01-01T00:00:00Z"),
                                             make_chunks("doc-b", 3))
                                 .ok(),
                             "insert b");
                     require(catalog->mark_deleted("doc-a").ok(), "delete a");

                     std::vector<nexarag::index::VectorEntry> replayed;
                     const auto status = catalog->for_each_vector([&](nexarag::index::VectorEntry &&entry) {
                       replayed.push_back(std::move(entry));
                       return common::Status::success();
                     });
                     require(status.ok(), status.error());
                     require(replayed.size() == 3, "only live vectors");
                     require(replayed[0].chunk_id == "doc-b:0" && replayed[2].chunk_id == "doc-b:2",
                             "insert order");
                     require(replayed[1].vector.size() == 3, "dimension preserved");
                     require(std::fabs(replayed[1].vector[0] - 1.0F) < 1e-6F &&
                                 std::fabs(replayed[1].vector[2] + 1.25F) < 1e-6F,
                             "values preserved");
                   }});

  tests.push_back({"catalog_replay_stops_on_visitor_error", [] {
                     nexarag::testing::TempWorkspace ws;
                     auto catalog = open_catalog(ws);
                     require(catalog->insert(make_document("doc-a", "/docs/a.md",
                                                           "2024-01-01T00:00:00Z"),
                                             make_chunks("doc-a", 4))
                                 .ok(),
                             "insert a");
                     std::size_t visited = 0;
                     const auto status =
                         catalog->for_each_vector([&](nexarag::index::VectorEntry &&) {
                           ++visited;
                           return common::Status::error(common::ErrorCode::Cancelled, "stop");
                         });
                     require(status.code() == common::ErrorCode::Cancelled, "visitor error returned");
                     require(visited == 1, "replay stopped");
                   }});

  tests.push_back({"catalog_persists_across_reopen", [] {
                     nexarag::testing::TempWorkspace ws;
                     {
                       auto catalog = open_catalog(ws);
                       require(catalog->insert(make_document("doc-a", "/docs/a.md",
                                                             "2024-01-01T00:00:00Z"),
                                               make_chunks("doc-a", 2))
                                   .ok(),
                               "insert");
                     }
                     auto reopened = open_catalog(ws);
                     require(reopened->list_documents().value().size() == 1, "document survives");
                     require(reopened->chunk_count().value() == 2, "chunks survive");
                   }});
}
