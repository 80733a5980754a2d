#include "nexarag/ingest/orchestrator.hpp"

#include "nexarag/common/hash.hpp"
#include "nexarag/common/time.hpp"
#include "nexarag/observability/global.hpp"

#include <chrono>
#include <filesystem>

namespace nexarag::ingest {

namespace {

constexpr std::size_t kPruneLocksAbove = 1024;

std::string make_document_id(const std::string &source_path, const std::string &checksum,
                             const std::string &version) {
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
  const std::string seed =
      source_path + "|" + checksum + "|" + version + "|" + std::to_string(nanos);
  return "doc-" + common::sha256_hex(seed).substr(0, 16);
}

DocumentOutcome failed(const std::string &source_path, const common::ErrorCode code,
                       const std::string &message) {
  observability::record_error("ingest", source_path + ": " + message);
  return DocumentOutcome{.source_path = source_path,
                         .document_id = "",
                         .status = IngestStatus::Failed,
                         .chunks = 0,
                         .code = code,
                         .message = message};
}

} // namespace

const char *ingest_status_name(const IngestStatus status) {
  switch (status) {
  case IngestStatus::Succeeded:
    return "succeeded";
  case IngestStatus::Failed:
    return "failed";
  case IngestStatus::Skipped:
    return "skipped";
  }
  return "unknown";
}

std::size_t IngestSummary::succeeded() const {
  std::size_t count = 0;
  for (const auto &doc : documents) {
    count += doc.status == IngestStatus::Succeeded ? 1 : 0;
  }
  return count;
}

std::size_t IngestSummary::failed() const {
  std::size_t count = 0;
  for (const auto &doc : documents) {
    count += doc.status == IngestStatus::Failed ? 1 : 0;
  }
  return count;
}

std::size_t IngestSummary::skipped() const {
  std::size_t count = 0;
  for (const auto &doc : documents) {
    count += doc.status == IngestStatus::Skipped ? 1 : 0;
  }
  return count;
}

std::string normalize_source_path(const std::string &path) {
  std::error_code ec;
  auto canonical = std::filesystem::weakly_canonical(std::filesystem::path(path), ec);
  if (ec) {
    canonical = std::filesystem::absolute(std::filesystem::path(path), ec);
    if (ec) {
      return path;
    }
  }
  return canonical.lexically_normal().string();
}

IngestionOrchestrator::IngestionOrchestrator(std::shared_ptr<store::DocumentCatalog> catalog,
                                             std::shared_ptr<index::IVectorIndex> index,
                                             std::shared_ptr<embedding::IEmbedder> embedder,
                                             std::shared_ptr<IFileLoader> loader,
                                             ChunkingOptions chunking)
    : catalog_(std::move(catalog)), index_(std::move(index)), embedder_(std::move(embedder)),
      loader_(std::move(loader)), chunking_(chunking) {}

std::shared_ptr<std::mutex> IngestionOrchestrator::lock_for(const std::string &source_path) {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  if (path_locks_.size() > kPruneLocksAbove) {
    for (auto it = path_locks_.begin(); it != path_locks_.end();) {
      it = it->second.expired() ? path_locks_.erase(it) : std::next(it);
    }
  }
  auto &slot = path_locks_[source_path];
  auto mutex = slot.lock();
  if (mutex == nullptr) {
    mutex = std::make_shared<std::mutex>();
    slot = mutex;
  }
  return mutex;
}

common::Result<IngestSummary> IngestionOrchestrator::ingest(const std::vector<std::string> &paths,
                                                            const IngestOptions &options) {
  if (chunking_.chunk_size == 0 || chunking_.overlap >= chunking_.chunk_size) {
    return common::Result<IngestSummary>::failure(
        common::ErrorCode::Configuration,
        "chunk overlap (" + std::to_string(chunking_.overlap) +
            ") must be smaller than chunk size (" + std::to_string(chunking_.chunk_size) + ")");
  }

  observability::ScopedLatency latency("ingest");
  IngestSummary summary;
  const auto gathered = gather_sources(paths, *loader_);
  for (const auto &error : gathered.errors) {
    summary.documents.push_back(failed(error.path, error.code, error.message));
  }
  for (const auto &file : gathered.files) {
    summary.documents.push_back(ingest_one(normalize_source_path(file.string()), options));
  }
  return common::Result<IngestSummary>::success(std::move(summary));
}

DocumentOutcome IngestionOrchestrator::ingest_one(const std::string &source_path,
                                                  const IngestOptions &options) {
  const auto started = std::chrono::steady_clock::now();
  const auto path_lock = lock_for(source_path);
  std::lock_guard<std::mutex> guard(*path_lock);

  auto text = loader_->load(source_path);
  if (!text.ok()) {
    return failed(source_path, text.code(), text.error());
  }
  const std::string checksum = common::sha256_hex(text.value());

  auto existing = catalog_->find_live_by_path(source_path);
  if (!existing.ok()) {
    return failed(source_path, existing.code(), existing.error());
  }
  if (existing.value().has_value() && existing.value()->checksum == checksum) {
    const auto &record = *existing.value();
    observability::record_event(observability::IngestEvent{
        .source_path = source_path, .document_id = record.id, .status = "skipped",
        .chunks = record.chunk_count, .duration = std::chrono::milliseconds(0)});
    return DocumentOutcome{.source_path = source_path,
                           .document_id = record.id,
                           .status = IngestStatus::Skipped,
                           .chunks = record.chunk_count,
                           .code = std::nullopt,
                           .message = "unchanged"};
  }

  auto chunks = chunk_text(text.value(), chunking_);
  if (!chunks.ok()) {
    return failed(source_path, chunks.code(), chunks.error());
  }

  std::vector<std::string> texts;
  texts.reserve(chunks.value().size());
  for (const auto &chunk : chunks.value()) {
    texts.push_back(chunk.text);
  }

  // Embedding may block on the network; it completes before any index write.
  std::vector<embedding::Embedding> vectors;
  if (!texts.empty()) {
    auto embedded = embedder_->embed_batch(texts);
    if (!embedded.ok()) {
      return failed(source_path, embedded.code(), embedded.error());
    }
    vectors = std::move(embedded.value());
  }
  if (vectors.size() != texts.size()) {
    return failed(source_path, common::ErrorCode::EmbeddingUnavailable,
                  "embedder returned " + std::to_string(vectors.size()) + " vectors for " +
                      std::to_string(texts.size()) + " chunks");
  }
  for (const auto &vector : vectors) {
    if (auto status = embedding::check_dimensions(vector, index_->dimension(), embedder_->name());
        !status.ok()) {
      return failed(source_path, status.code(), status.error());
    }
  }

  store::DocumentRecord document;
  document.id = make_document_id(source_path, checksum, options.version);
  document.source_path = source_path;
  document.version = options.version;
  document.tags = options.tags;
  document.ingested_at = common::now_rfc3339();
  document.checksum = checksum;
  document.chunk_count = chunks.value().size();

  std::vector<store::ChunkRecord> records;
  std::vector<index::VectorEntry> entries;
  records.reserve(chunks.value().size());
  entries.reserve(chunks.value().size());
  for (std::size_t i = 0; i < chunks.value().size(); ++i) {
    const auto &chunk = chunks.value()[i];
    const std::string chunk_id = document.id + ":" + std::to_string(chunk.ordinal);
    records.push_back(store::ChunkRecord{.id = chunk_id,
                                         .document_id = document.id,
                                         .ordinal = chunk.ordinal,
                                         .text = chunk.text,
                                         .start_offset = chunk.start_offset,
                                         .end_offset = chunk.end_offset,
                                         .vector = vectors[i]});
    entries.push_back(index::VectorEntry{
        .chunk_id = chunk_id, .document_id = document.id, .vector = std::move(vectors[i])});
  }

  // Holds off clear until the catalog and index agree again.
  std::shared_lock writers(writers_mutex_);
  auto live = catalog_->find_live_by_path(source_path);
  if (!live.ok()) {
    return failed(source_path, live.code(), live.error());
  }

  if (auto status = catalog_->insert(document, records); !status.ok()) {
    return failed(source_path, status.code(), status.error());
  }
  if (auto status = index_->add(std::move(entries)); !status.ok()) {
    if (auto rollback = catalog_->erase(document.id); !rollback.ok()) {
      observability::record_error("ingest", "rollback of " + document.id +
                                                " failed: " + rollback.error());
    }
    return failed(source_path, status.code(), status.error());
  }

  DocumentOutcome outcome{.source_path = source_path,
                          .document_id = document.id,
                          .status = IngestStatus::Succeeded,
                          .chunks = document.chunk_count,
                          .code = std::nullopt,
                          .message = ""};

  // The previous version is retired only once the new one is searchable.
  if (live.value().has_value()) {
    const std::string &previous = live.value()->id;
    if (auto status = drop_document(previous); !status.ok()) {
      outcome.message = "previous version " + previous + " not removed: " + status.error();
      observability::record_error("ingest", source_path + ": " + outcome.message);
    } else {
      outcome.message = "replaced " + previous;
    }
  }

  observability::record_event(observability::IngestEvent{
      .source_path = source_path,
      .document_id = document.id,
      .status = "succeeded",
      .chunks = document.chunk_count,
      .duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)});
  return outcome;
}

common::Status IngestionOrchestrator::drop_document(const std::string &document_id) {
  if (auto status = catalog_->mark_deleted(document_id); !status.ok()) {
    return status;
  }
  return index_->remove(document_id);
}

common::Status IngestionOrchestrator::remove_document(const std::string &document_id) {
  auto document = catalog_->get_document(document_id);
  if (!document.ok()) {
    return document.status();
  }
  if (!document.value().has_value() || document.value()->deleted) {
    return common::Status::error(common::ErrorCode::NotFound, "unknown document: " + document_id);
  }
  const auto path_lock = lock_for(document.value()->source_path);
  std::lock_guard<std::mutex> guard(*path_lock);
  std::shared_lock writers(writers_mutex_);
  return drop_document(document_id);
}

common::Status IngestionOrchestrator::remove_source(const std::string &path) {
  const std::string source_path = normalize_source_path(path);
  const auto path_lock = lock_for(source_path);
  std::lock_guard<std::mutex> guard(*path_lock);
  std::shared_lock writers(writers_mutex_);
  auto existing = catalog_->find_live_by_path(source_path);
  if (!existing.ok()) {
    return existing.status();
  }
  if (!existing.value().has_value()) {
    return common::Status::error(common::ErrorCode::NotFound,
                                 "no live document for " + source_path);
  }
  return drop_document(existing.value()->id);
}

common::Result<std::vector<store::DocumentRecord>> IngestionOrchestrator::list_documents() const {
  return catalog_->list_documents();
}

common::Status IngestionOrchestrator::clear() {
  std::unique_lock writers(writers_mutex_);
  if (auto status = index_->clear(); !status.ok()) {
    return status;
  }
  return catalog_->clear();
}

} // namespace nexarag::ingest
