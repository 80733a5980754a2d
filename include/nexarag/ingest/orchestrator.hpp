#pragma once

#include "nexarag/embedding/embedder.hpp"
#include "nexarag/index/vector_index.hpp"
#include "nexarag/ingest/chunker.hpp"
#include "nexarag/ingest/loader.hpp"
#include "nexarag/store/document_catalog.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace nexarag::ingest {

enum class IngestStatus {
  Succeeded,
  Failed,
  Skipped,
};

[[nodiscard]] const char *ingest_status_name(IngestStatus status);

struct DocumentOutcome {
  std::string source_path;
  std::string document_id;
  IngestStatus status = IngestStatus::Failed;
  std::size_t chunks = 0;
  std::optional<common::ErrorCode> code;
  std::string message;
};

struct IngestSummary {
  std::vector<DocumentOutcome> documents;

  [[nodiscard]] std::size_t succeeded() const;
  [[nodiscard]] std::size_t failed() const;
  [[nodiscard]] std::size_t skipped() const;
};

struct IngestOptions {
  std::string version;
  std::vector<std::string> tags;
};

class IngestionOrchestrator {
public:
  IngestionOrchestrator(std::shared_ptr<store::DocumentCatalog> catalog,
                        std::shared_ptr<index::IVectorIndex> index,
                        std::shared_ptr<embedding::IEmbedder> embedder,
                        std::shared_ptr<IFileLoader> loader, ChunkingOptions chunking);

  [[nodiscard]] common::Result<IngestSummary> ingest(const std::vector<std::string> &paths,
                                                     const IngestOptions &options = {});

  [[nodiscard]] common::Status remove_document(const std::string &document_id);
  [[nodiscard]] common::Status remove_source(const std::string &path);
  [[nodiscard]] common::Result<std::vector<store::DocumentRecord>> list_documents() const;
  [[nodiscard]] common::Status clear();

private:
  [[nodiscard]] DocumentOutcome ingest_one(const std::string &source_path,
                                           const IngestOptions &options);
  [[nodiscard]] common::Status drop_document(const std::string &document_id);
  [[nodiscard]] std::shared_ptr<std::mutex> lock_for(const std::string &source_path);

  std::shared_ptr<store::DocumentCatalog> catalog_;
  std::shared_ptr<index::IVectorIndex> index_;
  std::shared_ptr<embedding::IEmbedder> embedder_;
  std::shared_ptr<IFileLoader> loader_;
  ChunkingOptions chunking_;

  // Shared by document writers, exclusive for clear.
  std::shared_mutex writers_mutex_;
  std::mutex locks_mutex_;
  std::unordered_map<std::string, std::weak_ptr<std::mutex>> path_locks_;
};

[[nodiscard]] std::string normalize_source_path(const std::string &path);

} // namespace nexarag::ingest
