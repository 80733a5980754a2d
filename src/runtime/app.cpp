#include "nexarag/runtime/app.hpp"

#include "nexarag/config/config.hpp"
#include "nexarag/observability/factory.hpp"
#include "nexarag/observability/global.hpp"

namespace nexarag::runtime {

common::Result<std::shared_ptr<RagEngine>> RagEngine::create(const config::Config &config,
                                                             EngineDependencies dependencies) {
  using EngineResult = common::Result<std::shared_ptr<RagEngine>>;

  auto warnings = config::validate_config(config);
  if (!warnings.ok()) {
    return warnings.forward_error<std::shared_ptr<RagEngine>>();
  }
  for (const auto &warning : warnings.value()) {
    observability::record_error("config", warning);
  }

  auto data_dir = config::data_dir(config);
  if (!data_dir.ok()) {
    return data_dir.forward_error<std::shared_ptr<RagEngine>>();
  }

  std::shared_ptr<RagEngine> engine(new RagEngine());
  engine->config_ = config;

  auto http_client = dependencies.http_client;
  if (http_client == nullptr) {
    http_client = std::make_shared<providers::CurlHttpClient>();
  }

  auto catalog = store::DocumentCatalog::open(data_dir.value() / "catalog.db");
  if (!catalog.ok()) {
    return catalog.forward_error<std::shared_ptr<RagEngine>>();
  }
  engine->catalog_ = catalog.value();

  engine->embedder_ = dependencies.embedder;
  if (engine->embedder_ == nullptr) {
    auto embedder = embedding::create_embedder(config.embedding, config.provider, http_client);
    if (!embedder.ok()) {
      return embedder.forward_error<std::shared_ptr<RagEngine>>();
    }
    engine->embedder_ = std::move(embedder.value());
  }

  auto index = index::create_vector_index(config.index, engine->embedder_->dimensions(),
                                          engine->catalog_, http_client);
  if (!index.ok()) {
    return index.forward_error<std::shared_ptr<RagEngine>>();
  }
  engine->index_ = std::move(index.value());

  // The flat index lives in memory; the catalog is its canonical copy.
  if (engine->index_->backend() == "flat") {
    if (auto status = engine->index_->rebuild(); !status.ok()) {
      return EngineResult::failure(status.code(), "loading index from catalog: " + status.error());
    }
  }

  engine->provider_store_ = std::make_shared<config::ProviderConfigStore>(
      config.provider, std::move(dependencies.persist_provider_config));
  if (dependencies.backend_factory) {
    engine->router_ = std::make_shared<providers::ProviderRouter>(
        engine->provider_store_, std::move(dependencies.backend_factory));
  } else {
    engine->router_ =
        std::make_shared<providers::ProviderRouter>(engine->provider_store_, http_client);
  }

  engine->sessions_ = dependencies.sessions;
  if (engine->sessions_ == nullptr) {
    engine->sessions_ = std::make_shared<sessions::FileSessionStore>(data_dir.value() / "sessions");
  }

  auto loader = dependencies.loader;
  if (loader == nullptr) {
    loader = std::make_shared<ingest::FileLoader>();
  }
  engine->ingestion_ = std::make_shared<ingest::IngestionOrchestrator>(
      engine->catalog_, engine->index_, engine->embedder_, std::move(loader),
      ingest::ChunkingOptions{.chunk_size = config.rag.chunk_size,
                              .overlap = config.rag.chunk_overlap});

  engine->retrieval_ = std::make_shared<rag::RetrievalPipeline>(
      engine->embedder_, engine->index_, engine->catalog_,
      rag::RetrievalOptions{.top_k = config.rag.top_k,
                            .similarity_threshold = config.rag.similarity_threshold,
                            .max_context_chars = config.rag.max_context_chars});

  auto prompts = rag::load_prompts(config.rag);
  if (!prompts.ok()) {
    return prompts.forward_error<std::shared_ptr<RagEngine>>();
  }
  engine->orchestrator_ = std::make_shared<rag::RagOrchestrator>(
      engine->retrieval_, engine->router_, engine->sessions_, std::move(prompts.value()));

  return EngineResult::success(std::move(engine));
}

common::Result<ingest::IngestSummary> RagEngine::ingest(const std::vector<std::string> &paths,
                                                        const ingest::IngestOptions &options) {
  return ingestion_->ingest(paths, options);
}

common::Status RagEngine::remove_document(const std::string &document_id) {
  return ingestion_->remove_document(document_id);
}

common::Status RagEngine::remove_source(const std::string &path) {
  return ingestion_->remove_source(path);
}

common::Result<std::vector<store::DocumentRecord>> RagEngine::list_documents() const {
  return ingestion_->list_documents();
}

common::Result<rag::QueryContext> RagEngine::retrieve(const std::string &query) const {
  return retrieval_->retrieve(query);
}

common::Result<rag::Answer> RagEngine::answer(const std::string &query,
                                              const std::string &session_id,
                                              const common::CancellationToken *cancel) {
  return orchestrator_->answer(query, session_id, cancel);
}

common::Result<EngineStats> RagEngine::stats() const {
  auto index_stats = index_->stats();
  if (!index_stats.ok()) {
    return index_stats.forward_error<EngineStats>();
  }
  auto documents = catalog_->list_documents();
  if (!documents.ok()) {
    return documents.forward_error<EngineStats>();
  }
  auto chunks = catalog_->chunk_count();
  if (!chunks.ok()) {
    return chunks.forward_error<EngineStats>();
  }
  return common::Result<EngineStats>::success(EngineStats{.index = std::move(index_stats.value()),
                                                          .documents = documents.value().size(),
                                                          .chunks = chunks.value()});
}

common::Status RagEngine::rebuild() { return index_->rebuild(); }

common::Status RagEngine::clear() { return ingestion_->clear(); }

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return loaded.forward_error<RuntimeContext>();
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

common::Result<std::shared_ptr<RagEngine>> RuntimeContext::create_engine() {
  auto observer = observability::create_observer(config_.observability);
  if (!observer.ok()) {
    return observer.forward_error<std::shared_ptr<RagEngine>>();
  }
  observability::set_global_observer(std::move(observer.value()));

  EngineDependencies dependencies;
  dependencies.persist_provider_config = [base = config_](const config::ProviderConfig &provider) {
    config::Config updated = base;
    updated.provider = provider;
    return config::save_config(updated);
  };
  return RagEngine::create(config_, std::move(dependencies));
}

} // namespace nexarag::runtime
