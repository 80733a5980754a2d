#include "nexarag/store/document_catalog.hpp"

#include <cstdint>
#include <cstring>
#include <sstream>

namespace nexarag::store {

namespace {

constexpr int kReplayPage = 512;

std::vector<unsigned char> vector_to_blob(const std::vector<float> &values) {
  std::vector<unsigned char> blob(values.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), values.data(), blob.size());
  }
  return blob;
}

std::vector<float> blob_to_vector(const void *blob, const int bytes) {
  if (blob == nullptr || bytes <= 0 || (bytes % static_cast<int>(sizeof(float)) != 0)) {
    return {};
  }
  const std::size_t length = static_cast<std::size_t>(bytes) / sizeof(float);
  std::vector<float> values(length);
  std::memcpy(values.data(), blob, static_cast<std::size_t>(bytes));
  return values;
}

std::string join_tags(const std::vector<std::string> &tags) {
  std::string out;
  for (const auto &tag : tags) {
    if (!out.empty()) {
      out.push_back('\n');
    }
    out += tag;
  }
  return out;
}

std::vector<std::string> split_tags(const std::string &joined) {
  std::vector<std::string> tags;
  std::istringstream stream(joined);
  std::string tag;
  while (std::getline(stream, tag)) {
    if (!tag.empty()) {
      tags.push_back(tag);
    }
  }
  return tags;
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : std::string(reinterpret_cast<const char *>(text));
}

common::Status sqlite_error(sqlite3 *db, const std::string &what) {
  return common::Status::error(common::ErrorCode::Storage, what + ": " + sqlite3_errmsg(db));
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorCode::Storage, msg);
  }
  return common::Status::success();
}

// Finalizes the statement on scope exit.
class Statement {
public:
  Statement(sqlite3 *db, const char *sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      stmt_ = nullptr;
    }
  }
  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  [[nodiscard]] bool ok() const { return stmt_ != nullptr; }
  [[nodiscard]] sqlite3_stmt *get() const { return stmt_; }

  void bind_text(const int index, const std::string &value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
  }
  void bind_int64(const int index, const std::int64_t value) {
    sqlite3_bind_int64(stmt_, index, value);
  }

private:
  sqlite3_stmt *stmt_ = nullptr;
};

constexpr const char *kDocumentColumns =
    "id, source_path, version, tags, ingested_at, checksum, chunk_count, deleted";

DocumentRecord row_to_document(sqlite3_stmt *stmt) {
  DocumentRecord record;
  record.id = column_text(stmt, 0);
  record.source_path = column_text(stmt, 1);
  record.version = column_text(stmt, 2);
  record.tags = split_tags(column_text(stmt, 3));
  record.ingested_at = column_text(stmt, 4);
  record.checksum = column_text(stmt, 5);
  record.chunk_count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 6));
  record.deleted = sqlite3_column_int(stmt, 7) != 0;
  return record;
}

} // namespace

common::Result<std::shared_ptr<DocumentCatalog>>
DocumentCatalog::open(const std::filesystem::path &db_path) {
  using OpenResult = common::Result<std::shared_ptr<DocumentCatalog>>;
  std::error_code ec;
  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path(), ec);
    if (ec) {
      return OpenResult::failure(common::ErrorCode::Io, "cannot create " +
                                                            db_path.parent_path().string() + ": " +
                                                            ec.message());
    }
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(db_path.string().c_str(), &db) != SQLITE_OK) {
    const std::string message = db == nullptr ? "out of memory" : sqlite3_errmsg(db);
    if (db != nullptr) {
      sqlite3_close(db);
    }
    return OpenResult::failure(common::ErrorCode::Storage,
                               "cannot open catalog " + db_path.string() + ": " + message);
  }
  sqlite3_busy_timeout(db, 5000);

  std::shared_ptr<DocumentCatalog> catalog(new DocumentCatalog(db));
  if (auto status = catalog->init_schema(); !status.ok()) {
    return OpenResult::failure(status.code(), status.error());
  }
  return OpenResult::success(std::move(catalog));
}

DocumentCatalog::DocumentCatalog(sqlite3 *db) : db_(db) {}

DocumentCatalog::~DocumentCatalog() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status DocumentCatalog::init_schema() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }
  status = exec_sql(db_, "PRAGMA foreign_keys=ON;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS documents (
  id TEXT PRIMARY KEY,
  source_path TEXT NOT NULL,
  version TEXT NOT NULL DEFAULT '',
  tags TEXT NOT NULL DEFAULT '',
  ingested_at TEXT NOT NULL,
  checksum TEXT NOT NULL,
  chunk_count INTEGER NOT NULL DEFAULT 0,
  deleted INTEGER NOT NULL DEFAULT 0
);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, "CREATE INDEX IF NOT EXISTS documents_path ON documents(source_path, "
                         "deleted);");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS chunks (
  seq INTEGER PRIMARY KEY AUTOINCREMENT,
  id TEXT NOT NULL UNIQUE,
  document_id TEXT NOT NULL REFERENCES documents(id) ON DELETE CASCADE,
  ordinal INTEGER NOT NULL,
  text TEXT NOT NULL,
  start_offset INTEGER NOT NULL,
  end_offset INTEGER NOT NULL,
  embedding BLOB NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, "CREATE INDEX IF NOT EXISTS chunks_document ON chunks(document_id);");
}

common::Result<std::optional<DocumentRecord>>
DocumentCatalog::find_live_by_path(const std::string &source_path) const {
  using FindResult = common::Result<std::optional<DocumentRecord>>;
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string sql = std::string("SELECT ") + kDocumentColumns +
                          " FROM documents WHERE source_path = ?1 AND deleted = 0"
                          " ORDER BY ingested_at DESC LIMIT 1";
  Statement stmt(db_, sql.c_str());
  if (!stmt.ok()) {
    const auto status = sqlite_error(db_, "find document");
    return FindResult::failure(status.code(), status.error());
  }
  stmt.bind_text(1, source_path);
  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return FindResult::success(row_to_document(stmt.get()));
  }
  if (rc != SQLITE_DONE) {
    const auto status = sqlite_error(db_, "find document");
    return FindResult::failure(status.code(), status.error());
  }
  return FindResult::success(std::nullopt);
}

common::Result<std::optional<DocumentRecord>>
DocumentCatalog::get_document(const std::string &document_id) const {
  using FindResult = common::Result<std::optional<DocumentRecord>>;
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string sql =
      std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE id = ?1";
  Statement stmt(db_, sql.c_str());
  if (!stmt.ok()) {
    const auto status = sqlite_error(db_, "get document");
    return FindResult::failure(status.code(), status.error());
  }
  stmt.bind_text(1, document_id);
  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return FindResult::success(row_to_document(stmt.get()));
  }
  if (rc != SQLITE_DONE) {
    const auto status = sqlite_error(db_, "get document");
    return FindResult::failure(status.code(), status.error());
  }
  return FindResult::success(std::nullopt);
}

common::Result<std::vector<DocumentRecord>>
DocumentCatalog::list_documents(const bool include_deleted) const {
  using ListResult = common::Result<std::vector<DocumentRecord>>;
  std::lock_guard<std::mutex> lock(mutex_);
  std::string sql = std::string("SELECT ") + kDocumentColumns + " FROM documents";
  if (!include_deleted) {
    sql += " WHERE deleted = 0";
  }
  sql += " ORDER BY source_path ASC, ingested_at ASC";
  Statement stmt(db_, sql.c_str());
  if (!stmt.ok()) {
    const auto status = sqlite_error(db_, "list documents");
    return ListResult::failure(status.code(), status.error());
  }
  std::vector<DocumentRecord> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    out.push_back(row_to_document(stmt.get()));
  }
  if (rc != SQLITE_DONE) {
    const auto status = sqlite_error(db_, "list documents");
    return ListResult::failure(status.code(), status.error());
  }
  return ListResult::success(std::move(out));
}

common::Status DocumentCatalog::insert(const DocumentRecord &document,
                                       const std::vector<ChunkRecord> &chunks) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return status;
  }

  const auto rollback = [this](common::Status failure) {
    (void)exec_sql(db_, "ROLLBACK;");
    return failure;
  };

  {
    Statement stmt(db_, "INSERT INTO documents(id, source_path, version, tags, ingested_at, "
                        "checksum, chunk_count, deleted) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, 0)");
    if (!stmt.ok()) {
      return rollback(sqlite_error(db_, "insert document"));
    }
    stmt.bind_text(1, document.id);
    stmt.bind_text(2, document.source_path);
    stmt.bind_text(3, document.version);
    stmt.bind_text(4, join_tags(document.tags));
    stmt.bind_text(5, document.ingested_at);
    stmt.bind_text(6, document.checksum);
    stmt.bind_int64(7, static_cast<std::int64_t>(chunks.size()));
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return rollback(sqlite_error(db_, "insert document " + document.id));
    }
  }

  Statement stmt(db_, "INSERT INTO chunks(id, document_id, ordinal, text, start_offset, "
                      "end_offset, embedding) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7)");
  if (!stmt.ok()) {
    return rollback(sqlite_error(db_, "insert chunk"));
  }
  for (const auto &chunk : chunks) {
    const auto blob = vector_to_blob(chunk.vector);
    sqlite3_reset(stmt.get());
    sqlite3_clear_bindings(stmt.get());
    stmt.bind_text(1, chunk.id);
    stmt.bind_text(2, document.id);
    stmt.bind_int64(3, static_cast<std::int64_t>(chunk.ordinal));
    stmt.bind_text(4, chunk.text);
    stmt.bind_int64(5, static_cast<std::int64_t>(chunk.start_offset));
    stmt.bind_int64(6, static_cast<std::int64_t>(chunk.end_offset));
    sqlite3_bind_blob(stmt.get(), 7, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return rollback(sqlite_error(db_, "insert chunk " + chunk.id));
    }
  }

  status = exec_sql(db_, "COMMIT;");
  if (!status.ok()) {
    return rollback(status);
  }
  return common::Status::success();
}

common::Status DocumentCatalog::mark_deleted(const std::string &document_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return status;
  }
  {
    Statement stmt(db_, "UPDATE documents SET deleted = 1 WHERE id = ?1");
    if (!stmt.ok()) {
      (void)exec_sql(db_, "ROLLBACK;");
      return sqlite_error(db_, "delete document");
    }
    stmt.bind_text(1, document_id);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      const auto failure = sqlite_error(db_, "delete document " + document_id);
      (void)exec_sql(db_, "ROLLBACK;");
      return failure;
    }
    if (sqlite3_changes(db_) == 0) {
      (void)exec_sql(db_, "ROLLBACK;");
      return common::Status::error(common::ErrorCode::NotFound,
                                   "unknown document: " + document_id);
    }
  }
  {
    Statement stmt(db_, "DELETE FROM chunks WHERE document_id = ?1");
    if (!stmt.ok()) {
      (void)exec_sql(db_, "ROLLBACK;");
      return sqlite_error(db_, "delete chunks");
    }
    stmt.bind_text(1, document_id);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      const auto failure = sqlite_error(db_, "delete chunks of " + document_id);
      (void)exec_sql(db_, "ROLLBACK;");
      return failure;
    }
  }
  return exec_sql(db_, "COMMIT;");
}

common::Status DocumentCatalog::erase(const std::string &document_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  // Chunks follow through ON DELETE CASCADE.
  Statement stmt(db_, "DELETE FROM documents WHERE id = ?1");
  if (!stmt.ok()) {
    return sqlite_error(db_, "erase document");
  }
  stmt.bind_text(1, document_id);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return sqlite_error(db_, "erase document " + document_id);
  }
  return common::Status::success();
}

common::Status DocumentCatalog::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = exec_sql(db_, "BEGIN IMMEDIATE; DELETE FROM chunks; DELETE FROM documents;");
  if (!status.ok()) {
    (void)exec_sql(db_, "ROLLBACK;");
    return status;
  }
  return exec_sql(db_, "COMMIT;");
}

common::Result<std::vector<ChunkRecord>>
DocumentCatalog::get_chunks(const std::vector<std::string> &chunk_ids) const {
  using ChunksResult = common::Result<std::vector<ChunkRecord>>;
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "SELECT id, document_id, ordinal, text, start_offset, end_offset "
                      "FROM chunks WHERE id = ?1");
  if (!stmt.ok()) {
    const auto status = sqlite_error(db_, "get chunks");
    return ChunksResult::failure(status.code(), status.error());
  }
  std::vector<ChunkRecord> out;
  out.reserve(chunk_ids.size());
  for (const auto &chunk_id : chunk_ids) {
    sqlite3_reset(stmt.get());
    stmt.bind_text(1, chunk_id);
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
      continue;
    }
    if (rc != SQLITE_ROW) {
      const auto status = sqlite_error(db_, "get chunk " + chunk_id);
      return ChunksResult::failure(status.code(), status.error());
    }
    ChunkRecord record;
    record.id = column_text(stmt.get(), 0);
    record.document_id = column_text(stmt.get(), 1);
    record.ordinal = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 2));
    record.text = column_text(stmt.get(), 3);
    record.start_offset = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 4));
    record.end_offset = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 5));
    out.push_back(std::move(record));
  }
  return ChunksResult::success(std::move(out));
}

common::Result<std::size_t> DocumentCatalog::chunk_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "SELECT COUNT(*) FROM chunks");
  if (!stmt.ok() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
    const auto status = sqlite_error(db_, "count chunks");
    return common::Result<std::size_t>::failure(status.code(), status.error());
  }
  return common::Result<std::size_t>::success(
      static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0)));
}

common::Status DocumentCatalog::for_each_vector(const Visitor &visit) const {
  std::int64_t after = 0;
  while (true) {
    std::vector<std::pair<std::int64_t, index::VectorEntry>> page;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      Statement stmt(db_, "SELECT c.seq, c.id, c.document_id, c.embedding FROM chunks c "
                          "JOIN documents d ON d.id = c.document_id "
                          "WHERE d.deleted = 0 AND c.seq > ?1 ORDER BY c.seq ASC LIMIT ?2");
      if (!stmt.ok()) {
        return sqlite_error(db_, "replay vectors");
      }
      stmt.bind_int64(1, after);
      stmt.bind_int64(2, kReplayPage);
      int rc = SQLITE_ROW;
      while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        index::VectorEntry entry;
        entry.chunk_id = column_text(stmt.get(), 1);
        entry.document_id = column_text(stmt.get(), 2);
        entry.vector = blob_to_vector(sqlite3_column_blob(stmt.get(), 3),
                                      sqlite3_column_bytes(stmt.get(), 3));
        page.emplace_back(sqlite3_column_int64(stmt.get(), 0), std::move(entry));
      }
      if (rc != SQLITE_DONE) {
        return sqlite_error(db_, "replay vectors");
      }
    }

    // The visitor runs without the catalog lock so it may block on I/O.
    for (auto &[seq, entry] : page) {
      after = seq;
      if (auto status = visit(std::move(entry)); !status.ok()) {
        return status;
      }
    }
    if (page.size() < static_cast<std::size_t>(kReplayPage)) {
      return common::Status::success();
    }
  }
}

} // namespace nexarag::store
