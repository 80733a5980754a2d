#include "test_framework.hpp"

#include "nexarag/common/fs.hpp"
#include "nexarag/config/config.hpp"
#include "nexarag/config/provider_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <thread>

namespace {

namespace cfg = nexarag::config;
namespace common = nexarag::common;
using nexarag::testing::EnvGuard;

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next) {
    old_override = cfg::config_path_override();
    cfg::set_config_path_override(std::move(next));
  }

  ~ConfigOverrideGuard() { cfg::set_config_path_override(old_override); }
};

// Clears every variable apply_env_overrides consults.
struct CleanEnv {
  EnvGuard provider{"NEXARAG_LLM_PROVIDER", std::nullopt};
  EnvGuard ollama_url{"NEXARAG_OLLAMA_BASE_URL", std::nullopt};
  EnvGuard ollama_model{"NEXARAG_OLLAMA_MODEL", std::nullopt};
  EnvGuard cloud_key{"NEXARAG_CLOUD_API_KEY", std::nullopt};
  EnvGuard openai_key{"OPENAI_API_KEY", std::nullopt};
  EnvGuard cloud_url{"NEXARAG_CLOUD_BASE_URL", std::nullopt};
  EnvGuard cloud_model{"NEXARAG_CLOUD_MODEL", std::nullopt};
  EnvGuard embedding{"NEXARAG_EMBEDDING_PROVIDER", std::nullopt};
  EnvGuard store{"NEXARAG_VECTOR_STORE", std::nullopt};
  EnvGuard data{"NEXARAG_DATA_DIR", std::nullopt};
  EnvGuard env_file{"NEXARAG_ENV_FILE", std::nullopt};
};

constexpr const char *kSampleConfig = R"(data_dir = "/var/lib/nexarag"

[llm]
provider = "cloud"
temperature = 0.4
max_tokens = 256
max_retries = 3

[llm.ollama]
base_url = "http://gpu-box:11434"
model = "llama3"
use_chat_api = false

[llm.cloud]
api_key = "sk-test"
model = "gpt-4o-mini"

[embedding]
provider = "ollama"
dimensions = 768

[index]
backend = "qdrant"
qdrant_collection = "support_docs"

[rag]
chunk_size = 200
chunk_overlap = 40
top_k = 6
similarity_threshold = 0.3
)";

} // namespace

void register_config_tests(std::vector<nexarag::tests::TestCase> &tests) {
  using nexarag::tests::require;

  tests.push_back({"config_defaults_are_valid", [] {
                     const cfg::Config config;
                     require(config.provider.active == "ollama", "ollama is the default provider");
                     require(config.rag.chunk_size == 400 && config.rag.chunk_overlap == 80,
                             "default chunking");
                     require(config.rag.top_k == 4, "default top k");
                     require(config.index.qdrant_collection == "nexa_support", "default collection");
                     const auto valid = cfg::validate_config(config);
                     require(valid.ok(), valid.error());
                     require(valid.value().empty(), "defaults produce no warnings");
                   }});

  tests.push_back({"parse_config_reads_all_sections", [] {
                     const auto parsed = cfg::parse_config(kSampleConfig);
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.data_dir == "/var/lib/nexarag", "data dir");
                     require(config.provider.active == "cloud", "active provider");
                     require(config.provider.generation.temperature == 0.4, "temperature");
                     require(config.provider.generation.max_tokens == 256, "max tokens");
                     require(config.provider.generation.max_retries == 3, "retries");
                     require(config.provider.ollama.model == "llama3", "ollama model");
                     require(!config.provider.ollama.use_chat_api, "generate api selected");
                     require(config.provider.cloud.api_key == "sk-test", "cloud key");
                     require(config.provider.cloud.base_url == "https://api.openai.com/v1",
                             "cloud base url default kept");
                     require(config.embedding.provider == "ollama", "embedding provider");
                     require(config.embedding.dimensions == 768, "dimensions");
                     require(config.index.backend == "qdrant", "index backend");
                     require(config.index.qdrant_collection == "support_docs", "collection");
                     require(config.rag.chunk_size == 200 && config.rag.chunk_overlap == 40,
                             "chunking");
                     require(config.rag.similarity_threshold == 0.3, "threshold");
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     nexarag::testing::TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const CleanEnv env;
                     const ConfigOverrideGuard guard(home.path() / "absent.toml");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().provider.active == "ollama", "default provider");
                     require(loaded.value().index.backend == "flat", "default backend");
                   }});

  tests.push_back({"environment_overrides_file_values", [] {
                     nexarag::testing::TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const CleanEnv env;
                     const auto path = home.create_file("config.toml", kSampleConfig);
                     const ConfigOverrideGuard guard(path);
                     const EnvGuard provider("NEXARAG_LLM_PROVIDER", std::string("OLLAMA"));
                     const EnvGuard model("NEXARAG_OLLAMA_MODEL", std::string("mistral:7b"));
                     const EnvGuard store("NEXARAG_VECTOR_STORE", std::string("flat"));

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().provider.active == "ollama", "env provider wins");
                     require(loaded.value().provider.ollama.model == "mistral:7b", "env model wins");
                     require(loaded.value().index.backend == "flat", "env store wins");
                     require(loaded.value().provider.cloud.api_key == "sk-test",
                             "file value kept when env unset");
                   }});

  tests.push_back({"openai_key_fills_empty_cloud_key", [] {
                     cfg::Config config;
                     const CleanEnv env;
                     const EnvGuard key("OPENAI_API_KEY", std::string("sk-fallback"));
                     cfg::apply_env_overrides(config);
                     require(config.provider.cloud.api_key == "sk-fallback", "fallback key used");
                   }});

  tests.push_back({"save_config_round_trips", [] {
                     nexarag::testing::TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const CleanEnv env;
                     const ConfigOverrideGuard guard(home.path() / "nexarag.toml");

                     auto config = cfg::parse_config(kSampleConfig).value();
                     config.provider.ollama.model = "qwen2";
                     require(cfg::save_config(config).ok(), "save should succeed");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().provider.ollama.model == "qwen2", "model persisted");
                     require(loaded.value().rag.top_k == 6, "rag section persisted");
                     require(loaded.value().embedding.dimensions == 768, "embedding persisted");
                   }});

  tests.push_back({"config_path_override_accepts_directory", [] {
                     nexarag::testing::TempWorkspace dir;
                     const ConfigOverrideGuard guard(dir.path());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == dir.path() / "config.toml", "directory override");
                   }});

  tests.push_back({"validate_config_rejects_bad_values", [] {
                     const auto expect_invalid = [](const cfg::Config &config,
                                                    const std::string &what) {
                       const auto result = cfg::validate_config(config);
                       require(!result.ok(), what + " should be rejected");
                       require(result.code() == common::ErrorCode::Configuration,
                               what + " should be a configuration error");
                     };
                     cfg::Config overlap;
                     overlap.rag.chunk_overlap = overlap.rag.chunk_size;
                     expect_invalid(overlap, "overlap >= chunk size");

                     cfg::Config provider;
                     provider.provider.active = "bedrock";
                     expect_invalid(provider, "unknown provider");

                     cfg::Config threshold;
                     threshold.rag.similarity_threshold = 1.5;
                     expect_invalid(threshold, "threshold above 1");

                     cfg::Config backend;
                     backend.index.backend = "faiss";
                     expect_invalid(backend, "unknown index backend");

                     cfg::Config top_p;
                     top_p.provider.generation.top_p = 0.0;
                     expect_invalid(top_p, "top_p of 0");

                     cfg::Config embedding;
                     embedding.embedding.provider = "word2vec";
                     expect_invalid(embedding, "unknown embedding provider");
                   }});

  tests.push_back({"validate_config_caps_retry_counts", [] {
                     cfg::Config at_cap;
                     at_cap.provider.generation.max_retries = cfg::kMaxRetries;
                     at_cap.embedding.max_retries = cfg::kMaxRetries;
                     const auto ok = cfg::validate_config(at_cap);
                     require(ok.ok(), ok.error());

                     cfg::Config llm;
                     llm.provider.generation.max_retries = 100;
                     const auto llm_result = cfg::validate_config(llm);
                     require(llm_result.code() == common::ErrorCode::Configuration,
                             "llm.max_retries above cap");
                     require(llm_result.error().find("llm.max_retries") != std::string::npos,
                             "names the llm key");

                     cfg::Config embedding;
                     embedding.embedding.max_retries = cfg::kMaxRetries + 1;
                     const auto embedding_result = cfg::validate_config(embedding);
                     require(embedding_result.code() == common::ErrorCode::Configuration,
                             "embedding.max_retries above cap");

                     auto provider = cfg::Config{}.provider;
                     provider.generation.max_retries = 64;
                     require(!cfg::validate_provider_config(provider).ok(),
                             "provider switch path rejects it too");
                   }});

  tests.push_back({"validate_config_warns_on_missing_cloud_key", [] {
                     cfg::Config config;
                     config.provider.active = "cloud";
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(result.value().size() == 1, "one warning expected");
                   }});

  tests.push_back({"provider_store_bumps_version_on_update", [] {
                     cfg::ProviderConfigStore store(cfg::ProviderConfig{});
                     const auto before = store.get_provider_config();
                     require(before->version == 1, "initial version");

                     cfg::ProviderConfigUpdate update;
                     update.active = " Cloud ";
                     update.cloud_model = "gpt-4o";
                     const auto updated = store.set_provider_config(update);
                     require(updated.ok(), updated.error());
                     require(updated.value()->version == 2, "version bumped");
                     require(updated.value()->config.active == "cloud", "active normalized");
                     require(updated.value()->config.cloud.model == "gpt-4o", "model merged");
                     require(updated.value()->config.ollama.model == "mistral",
                             "untouched fields kept");
                     require(before->config.active == "ollama", "old snapshot unchanged");
                   }});

  tests.push_back({"provider_store_rejects_invalid_update", [] {
                     cfg::ProviderConfigStore store(cfg::ProviderConfig{});
                     cfg::ProviderConfigUpdate update;
                     update.active = "unknown";
                     const auto result = store.set_provider_config(update);
                     require(!result.ok(), "unknown provider rejected");
                     require(result.code() == common::ErrorCode::Configuration, "config error");
                     require(store.get_provider_config()->version == 1, "snapshot kept");
                   }});

  tests.push_back({"provider_store_keeps_snapshot_when_persist_fails", [] {
                     std::size_t persisted = 0;
                     cfg::ProviderConfigStore store(
                         cfg::ProviderConfig{}, [&persisted](const cfg::ProviderConfig &) {
                           ++persisted;
                           return common::Status::error(common::ErrorCode::Io, "disk full");
                         });
                     cfg::ProviderConfigUpdate update;
                     update.ollama_model = "llama3";
                     const auto result = store.set_provider_config(update);
                     require(!result.ok(), "persist failure surfaces");
                     require(result.code() == common::ErrorCode::Io, "io code kept");
                     require(persisted == 1, "persist attempted once");
                     require(store.get_provider_config()->config.ollama.model == "mistral",
                             "snapshot unchanged");
                   }});

  tests.push_back({"provider_store_concurrent_updates_keep_all_fields", [] {
                     cfg::ProviderConfigStore store(cfg::ProviderConfig{});
                     std::thread model_writer([&store] {
                       for (int i = 0; i < 50; ++i) {
                         cfg::ProviderConfigUpdate update;
                         update.ollama_model = "model-" + std::to_string(i);
                         (void)store.set_provider_config(update);
                       }
                     });
                     std::thread temperature_writer([&store] {
                       for (int i = 0; i < 50; ++i) {
                         cfg::ProviderConfigUpdate update;
                         update.temperature = 0.5;
                         (void)store.set_provider_config(update);
                       }
                     });
                     model_writer.join();
                     temperature_writer.join();
                     const auto final_snapshot = store.get_provider_config();
                     require(final_snapshot->version == 101, "every update published");
                     require(final_snapshot->config.ollama.model == "model-49", "last model");
                     require(final_snapshot->config.generation.temperature == 0.5,
                             "temperature not lost");
                   }});
}
