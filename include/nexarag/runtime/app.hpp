#pragma once

#include "nexarag/common/result.hpp"
#include "nexarag/config/provider_store.hpp"
#include "nexarag/config/schema.hpp"
#include "nexarag/embedding/embedder.hpp"
#include "nexarag/index/vector_index.hpp"
#include "nexarag/ingest/orchestrator.hpp"
#include "nexarag/providers/router.hpp"
#include "nexarag/rag/orchestrator.hpp"
#include "nexarag/rag/retrieval.hpp"
#include "nexarag/sessions/store.hpp"
#include "nexarag/store/document_catalog.hpp"

#include <memory>

namespace nexarag::runtime {

struct EngineStats {
  index::IndexStats index;
  std::size_t documents = 0;
  std::size_t chunks = 0;
};

struct EngineDependencies {
  std::shared_ptr<providers::HttpClient> http_client;
  std::shared_ptr<embedding::IEmbedder> embedder;
  std::shared_ptr<ingest::IFileLoader> loader;
  std::shared_ptr<sessions::ISessionStore> sessions;
  providers::ProviderRouter::BackendFactory backend_factory;
  config::ProviderConfigStore::PersistFn persist_provider_config;
};

class RagEngine {
public:
  [[nodiscard]] static common::Result<std::shared_ptr<RagEngine>>
  create(const config::Config &config, EngineDependencies dependencies = {});

  [[nodiscard]] common::Result<ingest::IngestSummary>
  ingest(const std::vector<std::string> &paths, const ingest::IngestOptions &options = {});
  [[nodiscard]] common::Status remove_document(const std::string &document_id);
  [[nodiscard]] common::Status remove_source(const std::string &path);
  [[nodiscard]] common::Result<std::vector<store::DocumentRecord>> list_documents() const;

  [[nodiscard]] common::Result<rag::QueryContext> retrieve(const std::string &query) const;
  [[nodiscard]] common::Result<rag::Answer> answer(const std::string &query,
                                                   const std::string &session_id = "",
                                                   const common::CancellationToken *cancel = nullptr);

  [[nodiscard]] common::Result<EngineStats> stats() const;
  [[nodiscard]] common::Status rebuild();
  [[nodiscard]] common::Status clear();

  [[nodiscard]] providers::ProviderRouter &router() { return *router_; }
  [[nodiscard]] sessions::ISessionStore &sessions() { return *sessions_; }
  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] const index::IVectorIndex &vector_index() const { return *index_; }

private:
  RagEngine() = default;

  config::Config config_;
  std::shared_ptr<store::DocumentCatalog> catalog_;
  std::shared_ptr<embedding::IEmbedder> embedder_;
  std::shared_ptr<index::IVectorIndex> index_;
  std::shared_ptr<config::ProviderConfigStore> provider_store_;
  std::shared_ptr<providers::ProviderRouter> router_;
  std::shared_ptr<sessions::ISessionStore> sessions_;
  std::shared_ptr<ingest::IngestionOrchestrator> ingestion_;
  std::shared_ptr<rag::RetrievalPipeline> retrieval_;
  std::shared_ptr<rag::RagOrchestrator> orchestrator_;
};

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  [[nodiscard]] common::Result<std::shared_ptr<RagEngine>> create_engine();

private:
  config::Config config_;
};

} // namespace nexarag::runtime
