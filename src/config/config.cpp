#include "nexarag/config/config.hpp"

#include "nexarag/common/fs.hpp"
#include "nexarag/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace nexarag::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".nexarag";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

using ConfigResult = common::Result<std::vector<std::string>>;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("NEXARAG_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() < 2) {
    return value;
  }
  const char quote = value.front();
  if ((quote != '"' && quote != '\'') || value.back() != quote) {
    return value;
  }
  if (quote == '\'') {
    return value.substr(1, value.size() - 2);
  }
  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    if (value[i] == '\\' && i + 2 < value.size()) {
      const char next = value[++i];
      out.push_back(next == 'n' ? '\n' : next == 'r' ? '\r' : next == 't' ? '\t' : next);
      continue;
    }
    out.push_back(value[i]);
  }
  return out;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty() ||
      !(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    set_env_if_missing(common::trim(trimmed.substr(0, eq)), strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("NEXARAG_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Earlier files win: set_env_if_missing never overwrites.
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }
  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

bool one_of(const std::string &value, std::initializer_list<const char *> allowed) {
  const std::string normalized = common::to_lower(common::trim(value));
  for (const char *candidate : allowed) {
    if (normalized == candidate) {
      return true;
    }
  }
  return false;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::Configuration, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return home;
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return cfg_dir;
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

common::Result<std::filesystem::path> data_dir(const Config &config) {
  return common::ensure_dir(common::expand_path(config.data_dir));
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *value = env_value("NEXARAG_LLM_PROVIDER")) {
    config.provider.active = common::to_lower(value);
  }
  if (const char *value = env_value("NEXARAG_OLLAMA_BASE_URL")) {
    config.provider.ollama.base_url = value;
  }
  if (const char *value = env_value("NEXARAG_OLLAMA_MODEL")) {
    config.provider.ollama.model = value;
  }
  if (const char *value = env_value("NEXARAG_CLOUD_API_KEY")) {
    config.provider.cloud.api_key = value;
  } else if (const char *fallback = env_value("OPENAI_API_KEY");
             fallback != nullptr && config.provider.cloud.api_key.empty()) {
    config.provider.cloud.api_key = fallback;
  }
  if (const char *value = env_value("NEXARAG_CLOUD_BASE_URL")) {
    config.provider.cloud.base_url = value;
  }
  if (const char *value = env_value("NEXARAG_CLOUD_MODEL")) {
    config.provider.cloud.model = value;
  }
  if (const char *value = env_value("NEXARAG_EMBEDDING_PROVIDER")) {
    config.embedding.provider = common::to_lower(value);
  }
  if (const char *value = env_value("NEXARAG_VECTOR_STORE")) {
    config.index.backend = common::to_lower(value);
  }
  if (const char *value = env_value("NEXARAG_DATA_DIR")) {
    config.data_dir = value;
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return parsed.forward_error<Config>();
  }
  const auto &doc = parsed.value();
  Config config;

  config.data_dir = expand_config_value(doc.get_string("data_dir", config.data_dir));

  auto &provider = config.provider;
  provider.active = common::to_lower(doc.get_string("llm.provider", provider.active));
  provider.generation.temperature =
      doc.get_double("llm.temperature", provider.generation.temperature);
  provider.generation.top_p = doc.get_double("llm.top_p", provider.generation.top_p);
  provider.generation.max_tokens = doc.get_u32("llm.max_tokens", provider.generation.max_tokens);
  provider.generation.timeout_ms = doc.get_u64("llm.timeout_ms", provider.generation.timeout_ms);
  provider.generation.max_retries =
      doc.get_u32("llm.max_retries", provider.generation.max_retries);
  provider.generation.retry_backoff_ms =
      doc.get_u64("llm.retry_backoff_ms", provider.generation.retry_backoff_ms);

  provider.ollama.base_url =
      expand_config_value(doc.get_string("llm.ollama.base_url", provider.ollama.base_url));
  provider.ollama.model = doc.get_string("llm.ollama.model", provider.ollama.model);
  provider.ollama.use_chat_api =
      doc.get_bool("llm.ollama.use_chat_api", provider.ollama.use_chat_api);

  provider.cloud.api_key = expand_config_value(doc.get_string("llm.cloud.api_key"));
  provider.cloud.base_url =
      expand_config_value(doc.get_string("llm.cloud.base_url", provider.cloud.base_url));
  provider.cloud.model = doc.get_string("llm.cloud.model", provider.cloud.model);

  auto &embedding = config.embedding;
  embedding.provider = common::to_lower(doc.get_string("embedding.provider", embedding.provider));
  embedding.model = doc.get_string("embedding.model", embedding.model);
  embedding.dimensions = doc.get_size("embedding.dimensions", embedding.dimensions);
  embedding.batch_size = doc.get_size("embedding.batch_size", embedding.batch_size);
  embedding.base_url = expand_config_value(doc.get_string("embedding.base_url"));
  embedding.api_key = expand_config_value(doc.get_string("embedding.api_key"));
  embedding.timeout_ms = doc.get_u64("embedding.timeout_ms", embedding.timeout_ms);
  embedding.max_retries = doc.get_u32("embedding.max_retries", embedding.max_retries);
  embedding.retry_backoff_ms =
      doc.get_u64("embedding.retry_backoff_ms", embedding.retry_backoff_ms);

  auto &index = config.index;
  index.backend = common::to_lower(doc.get_string("index.backend", index.backend));
  index.qdrant_url = expand_config_value(doc.get_string("index.qdrant_url", index.qdrant_url));
  index.qdrant_api_key = expand_config_value(doc.get_string("index.qdrant_api_key"));
  index.qdrant_collection = doc.get_string("index.qdrant_collection", index.qdrant_collection);
  index.timeout_ms = doc.get_u64("index.timeout_ms", index.timeout_ms);

  auto &rag = config.rag;
  rag.chunk_size = doc.get_size("rag.chunk_size", rag.chunk_size);
  rag.chunk_overlap = doc.get_size("rag.chunk_overlap", rag.chunk_overlap);
  rag.top_k = doc.get_size("rag.top_k", rag.top_k);
  rag.similarity_threshold = doc.get_double("rag.similarity_threshold", rag.similarity_threshold);
  rag.max_context_chars = doc.get_size("rag.max_context_chars", rag.max_context_chars);
  rag.system_prompt_path = expand_config_value(doc.get_string("rag.system_prompt_path"));
  rag.rag_prompt_path = expand_config_value(doc.get_string("rag.rag_prompt_path"));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.forward_error<Config>();
  }
  const auto &path = cfg_path_result.value();

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::Configuration,
                                           "Unable to open config file: " + content.error());
  }
  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::Configuration,
                                           path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

std::string serialize_config(const Config &config) {
  std::ostringstream out;
  const auto &provider = config.provider;
  out << "data_dir = " << common::quote_toml_string(config.data_dir) << "\n";

  out << "\n[llm]\n";
  out << "provider = " << common::quote_toml_string(provider.active) << "\n";
  out << "temperature = " << provider.generation.temperature << "\n";
  out << "top_p = " << provider.generation.top_p << "\n";
  out << "max_tokens = " << provider.generation.max_tokens << "\n";
  out << "timeout_ms = " << provider.generation.timeout_ms << "\n";
  out << "max_retries = " << provider.generation.max_retries << "\n";
  out << "retry_backoff_ms = " << provider.generation.retry_backoff_ms << "\n";

  out << "\n[llm.ollama]\n";
  out << "base_url = " << common::quote_toml_string(provider.ollama.base_url) << "\n";
  out << "model = " << common::quote_toml_string(provider.ollama.model) << "\n";
  out << "use_chat_api = " << bool_to_toml(provider.ollama.use_chat_api) << "\n";

  out << "\n[llm.cloud]\n";
  if (!provider.cloud.api_key.empty()) {
    out << "api_key = " << common::quote_toml_string(provider.cloud.api_key) << "\n";
  }
  out << "base_url = " << common::quote_toml_string(provider.cloud.base_url) << "\n";
  out << "model = " << common::quote_toml_string(provider.cloud.model) << "\n";

  const auto &embedding = config.embedding;
  out << "\n[embedding]\n";
  out << "provider = " << common::quote_toml_string(embedding.provider) << "\n";
  out << "model = " << common::quote_toml_string(embedding.model) << "\n";
  out << "dimensions = " << embedding.dimensions << "\n";
  out << "batch_size = " << embedding.batch_size << "\n";
  if (!embedding.base_url.empty()) {
    out << "base_url = " << common::quote_toml_string(embedding.base_url) << "\n";
  }
  if (!embedding.api_key.empty()) {
    out << "api_key = " << common::quote_toml_string(embedding.api_key) << "\n";
  }
  out << "timeout_ms = " << embedding.timeout_ms << "\n";

  const auto &index = config.index;
  out << "\n[index]\n";
  out << "backend = " << common::quote_toml_string(index.backend) << "\n";
  out << "qdrant_url = " << common::quote_toml_string(index.qdrant_url) << "\n";
  if (!index.qdrant_api_key.empty()) {
    out << "qdrant_api_key = " << common::quote_toml_string(index.qdrant_api_key) << "\n";
  }
  out << "qdrant_collection = " << common::quote_toml_string(index.qdrant_collection) << "\n";

  const auto &rag = config.rag;
  out << "\n[rag]\n";
  out << "chunk_size = " << rag.chunk_size << "\n";
  out << "chunk_overlap = " << rag.chunk_overlap << "\n";
  out << "top_k = " << rag.top_k << "\n";
  out << "similarity_threshold = " << rag.similarity_threshold << "\n";
  out << "max_context_chars = " << rag.max_context_chars << "\n";
  if (!rag.system_prompt_path.empty()) {
    out << "system_prompt_path = " << common::quote_toml_string(rag.system_prompt_path) << "\n";
  }
  if (!rag.rag_prompt_path.empty()) {
    out << "rag_prompt_path = " << common::quote_toml_string(rag.rag_prompt_path) << "\n";
  }

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto path = config_path();
  if (!path.ok()) {
    return path.status();
  }
  return common::write_file_atomic(path.value(), serialize_config(config));
}

common::Status validate_provider_config(const ProviderConfig &provider) {
  const auto fail = [](const std::string &message) {
    return common::Status::error(common::ErrorCode::Configuration, message);
  };
  if (!one_of(provider.active, {"ollama", "cloud"})) {
    return fail("Unknown llm.provider: " + provider.active);
  }
  if (provider.generation.temperature < 0.0 || provider.generation.temperature > 2.0) {
    return fail("llm.temperature must be between 0.0 and 2.0");
  }
  if (provider.generation.top_p <= 0.0 || provider.generation.top_p > 1.0) {
    return fail("llm.top_p must be in (0.0, 1.0]");
  }
  if (provider.generation.max_tokens == 0) {
    return fail("llm.max_tokens must be positive");
  }
  if (provider.generation.timeout_ms == 0) {
    return fail("llm.timeout_ms must be positive");
  }
  if (provider.generation.max_retries > kMaxRetries) {
    return fail("llm.max_retries must be at most " + std::to_string(kMaxRetries));
  }
  if (common::trim(provider.ollama.base_url).empty() || common::trim(provider.ollama.model).empty()) {
    return fail("llm.ollama requires base_url and model");
  }
  if (common::trim(provider.cloud.base_url).empty() || common::trim(provider.cloud.model).empty()) {
    return fail("llm.cloud requires base_url and model");
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  const auto fail = [](const std::string &message) {
    return ConfigResult::failure(common::ErrorCode::Configuration, message);
  };

  if (auto provider = validate_provider_config(config.provider); !provider.ok()) {
    return ConfigResult::failure(provider.code(), provider.error());
  }
  if (common::to_lower(config.provider.active) == "cloud" &&
      common::trim(config.provider.cloud.api_key).empty()) {
    warnings.push_back("llm.provider is cloud but llm.cloud.api_key is empty");
  }

  const auto &embedding = config.embedding;
  if (!one_of(embedding.provider, {"local", "ollama", "openai"})) {
    return fail("Invalid embedding.provider: " + embedding.provider);
  }
  if (embedding.dimensions == 0) {
    return fail("embedding.dimensions must be positive");
  }
  if (embedding.batch_size == 0) {
    return fail("embedding.batch_size must be positive");
  }
  if (embedding.max_retries > kMaxRetries) {
    return fail("embedding.max_retries must be at most " + std::to_string(kMaxRetries));
  }
  if (common::to_lower(embedding.provider) == "openai" && embedding.api_key.empty() &&
      config.provider.cloud.api_key.empty()) {
    warnings.push_back("embedding.provider is openai but no API key is configured");
  }

  if (!one_of(config.index.backend, {"flat", "qdrant"})) {
    return fail("Invalid index.backend: " + config.index.backend);
  }
  if (common::to_lower(config.index.backend) == "qdrant") {
    if (common::trim(config.index.qdrant_url).empty()) {
      return fail("index.qdrant_url is required for the qdrant backend");
    }
    if (common::trim(config.index.qdrant_collection).empty()) {
      return fail("index.qdrant_collection must not be empty");
    }
  }

  const auto &rag = config.rag;
  if (rag.chunk_size == 0) {
    return fail("rag.chunk_size must be positive");
  }
  if (rag.chunk_overlap >= rag.chunk_size) {
    return fail("rag.chunk_overlap must be smaller than rag.chunk_size");
  }
  if (rag.top_k == 0) {
    return fail("rag.top_k must be positive");
  }
  if (rag.similarity_threshold < -1.0 || rag.similarity_threshold > 1.0) {
    return fail("rag.similarity_threshold must be between -1.0 and 1.0");
  }
  if (rag.max_context_chars == 0) {
    return fail("rag.max_context_chars must be positive");
  }

  if (!one_of(config.observability.backend, {"log", "none", "noop"})) {
    return fail("Invalid observability.backend: " + config.observability.backend);
  }

  return ConfigResult::success(std::move(warnings));
}

} // namespace nexarag::config
