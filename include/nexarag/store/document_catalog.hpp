#pragma once

#include "nexarag/common/result.hpp"
#include "nexarag/index/vector_index.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace nexarag::store {

struct DocumentRecord {
  std::string id;
  std::string source_path;
  std::string version;
  std::vector<std::string> tags;
  std::string ingested_at;
  std::string checksum;
  std::size_t chunk_count = 0;
  bool deleted = false;
};

struct ChunkRecord {
  std::string id;
  std::string document_id;
  std::size_t ordinal = 0;
  std::string text;
  std::size_t start_offset = 0;
  std::size_t end_offset = 0;
  std::vector<float> vector;
};

// Canonical copy of documents, chunks and vectors; the index is rebuilt from it.
class DocumentCatalog final : public index::VectorSource {
public:
  [[nodiscard]] static common::Result<std::shared_ptr<DocumentCatalog>>
  open(const std::filesystem::path &db_path);

  ~DocumentCatalog() override;
  DocumentCatalog(const DocumentCatalog &) = delete;
  DocumentCatalog &operator=(const DocumentCatalog &) = delete;

  [[nodiscard]] common::Result<std::optional<DocumentRecord>>
  find_live_by_path(const std::string &source_path) const;
  [[nodiscard]] common::Result<std::optional<DocumentRecord>>
  get_document(const std::string &document_id) const;
  [[nodiscard]] common::Result<std::vector<DocumentRecord>>
  list_documents(bool include_deleted = false) const;

  [[nodiscard]] common::Status insert(const DocumentRecord &document,
                                      const std::vector<ChunkRecord> &chunks);
  [[nodiscard]] common::Status mark_deleted(const std::string &document_id);
  [[nodiscard]] common::Status erase(const std::string &document_id);
  [[nodiscard]] common::Status clear();

  [[nodiscard]] common::Result<std::vector<ChunkRecord>>
  get_chunks(const std::vector<std::string> &chunk_ids) const;
  [[nodiscard]] common::Result<std::size_t> chunk_count() const;

  [[nodiscard]] common::Status for_each_vector(const Visitor &visit) const override;

private:
  explicit DocumentCatalog(sqlite3 *db);
  [[nodiscard]] common::Status init_schema();

  sqlite3 *db_ = nullptr;
  mutable std::mutex mutex_;
};

} // namespace nexarag::store
