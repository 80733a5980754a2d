#include "nexarag/cli/commands.hpp"

#include "nexarag/common/fs.hpp"
#include "nexarag/config/config.hpp"
#include "nexarag/runtime/app.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace nexarag::cli {

namespace {

std::string version_string() {
#ifdef NEXARAG_VERSION
  std::string version = NEXARAG_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "nexarag " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

std::vector<std::string> take_repeated_option(std::vector<std::string> &args,
                                              const std::string &long_name,
                                              const std::string &short_name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, long_name, short_name, value)) {
    values.push_back(value);
  }
  return values;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

int report_error(const std::string &context, const common::ErrorCode code,
                 const std::string &message) {
  std::cerr << context << " failed [" << common::error_code_name(code) << "]: " << message << "\n";
  return 1;
}

int report_error(const std::string &context, const common::Status &status) {
  return report_error(context, status.code(), status.error());
}

// Loads the config and builds the engine, reporting any startup failure.
std::shared_ptr<runtime::RagEngine> open_engine() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    (void)report_error("config", context.code(), context.error());
    return nullptr;
  }
  auto engine = context.value().create_engine();
  if (!engine.ok()) {
    (void)report_error("startup", engine.code(), engine.error());
    return nullptr;
  }
  return engine.value();
}

int run_ingest(std::vector<std::string> args) {
  ingest::IngestOptions options;
  std::string version;
  if (take_option(args, "--version", "-v", version)) {
    options.version = version;
  }
  options.tags = take_repeated_option(args, "--tag", "-t");
  if (args.empty()) {
    std::cerr << "Usage: nexarag ingest <paths...> [--version V] [--tag T]\n";
    return 1;
  }

  auto engine_ptr = open_engine();
  if (engine_ptr == nullptr) {
    return 1;
  }
  auto &engine = *engine_ptr;
  auto summary = engine.ingest(args, options);
  if (!summary.ok()) {
    return report_error("ingest", summary.status());
  }
  for (const auto &doc : summary.value().documents) {
    std::cout << ingest::ingest_status_name(doc.status) << "  " << doc.source_path;
    if (!doc.document_id.empty()) {
      std::cout << "  " << doc.document_id << "  chunks=" << doc.chunks;
    }
    if (doc.code.has_value()) {
      std::cout << "  [" << common::error_code_name(*doc.code) << "] " << doc.message;
    } else if (!doc.message.empty()) {
      std::cout << "  (" << doc.message << ")";
    }
    std::cout << "\n";
  }
  std::cout << "succeeded=" << summary.value().succeeded()
            << " failed=" << summary.value().failed()
            << " skipped=" << summary.value().skipped() << "\n";
  return summary.value().failed() == 0 ? 0 : 1;
}

int run_ask(std::vector<std::string> args) {
  std::string session_id;
  (void)take_option(args, "--session", "-s", session_id);
  const std::string question = join_tokens(args);
  if (common::trim(question).empty()) {
    std::cerr << "Usage: nexarag ask <question> [--session ID]\n";
    return 1;
  }

  auto engine_ptr = open_engine();
  if (engine_ptr == nullptr) {
    return 1;
  }
  auto &engine = *engine_ptr;
  auto answer = engine.answer(question, session_id);
  if (!answer.ok()) {
    return report_error("ask", answer.status());
  }
  std::cout << answer.value().text << "\n";
  if (!answer.value().citations.empty()) {
    std::cout << "\nSources:\n";
    for (const auto &citation : answer.value().citations) {
      std::cout << "  " << std::fixed << std::setprecision(3) << citation.score << "  "
                << citation.chunk_id << "  " << citation.source_path << "\n";
    }
    std::cout << "(" << answer.value().provider << "/" << answer.value().model << ")\n";
  }
  return 0;
}

int run_documents() {
  auto engine_ptr = open_engine();
  if (engine_ptr == nullptr) {
    return 1;
  }
  auto &engine = *engine_ptr;
  auto documents = engine.list_documents();
  if (!documents.ok()) {
    return report_error("documents", documents.status());
  }
  if (documents.value().empty()) {
    std::cout << "No documents ingested.\n";
    return 0;
  }
  for (const auto &doc : documents.value()) {
    std::cout << doc.id << "  " << doc.source_path << "  chunks=" << doc.chunk_count;
    if (!doc.version.empty()) {
      std::cout << "  version=" << doc.version;
    }
    if (!doc.tags.empty()) {
      std::cout << "  tags=" << join_tokens(doc.tags);
    }
    std::cout << "  " << doc.ingested_at << "\n";
  }
  return 0;
}

int run_remove(std::vector<std::string> args) {
  std::string path;
  const bool by_path = take_option(args, "--path", "-p", path);
  if (!by_path && args.size() != 1) {
    std::cerr << "Usage: nexarag remove <document-id> | --path <source>\n";
    return 1;
  }
  auto engine_ptr = open_engine();
  if (engine_ptr == nullptr) {
    return 1;
  }
  auto &engine = *engine_ptr;
  const auto status = by_path ? engine.remove_source(path) : engine.remove_document(args[0]);
  if (!status.ok()) {
    return report_error("remove", status);
  }
  std::cout << "Removed " << (by_path ? path : args[0]) << "\n";
  return 0;
}

int print_stats(runtime::RagEngine &engine) {
  auto stats = engine.stats();
  if (!stats.ok()) {
    return report_error("stats", stats.status());
  }
  const auto &value = stats.value();
  std::cout << "Backend: " << value.index.backend << "\n";
  std::cout << "Entries: " << value.index.entry_count << "\n";
  std::cout << "Dimension: " << value.index.dimension << "\n";
  std::cout << "Generation: " << value.index.generation << "\n";
  std::cout << "Last build: " << value.index.last_build_at << "\n";
  std::cout << "Documents: " << value.documents << "\n";
  std::cout << "Chunks: " << value.chunks << "\n";
  return 0;
}

int run_stats() {
  auto engine_ptr = open_engine();
  if (engine_ptr == nullptr) {
    return 1;
  }
  return print_stats(*engine_ptr);
}

int run_rebuild() {
  auto engine_ptr = open_engine();
  if (engine_ptr == nullptr) {
    return 1;
  }
  auto &engine = *engine_ptr;
  if (auto status = engine.rebuild(); !status.ok()) {
    return report_error("rebuild", status);
  }
  std::cout << "Index rebuilt.\n";
  return print_stats(engine);
}

int run_clear() {
  auto engine_ptr = open_engine();
  if (engine_ptr == nullptr) {
    return 1;
  }
  auto &engine = *engine_ptr;
  if (auto status = engine.clear(); !status.ok()) {
    return report_error("clear", status);
  }
  std::cout << "Index and catalog cleared.\n";
  return 0;
}

int run_status() {
  auto engine_ptr = open_engine();
  if (engine_ptr == nullptr) {
    return 1;
  }
  auto &engine = *engine_ptr;
  const auto status = engine.router().status();
  auto cp = config::config_path();
  std::cout << "Provider: " << status.provider << "\n";
  std::cout << "Model: " << status.model << "\n";
  std::cout << "Base URL: " << status.base_url << "\n";
  std::cout << "Ready: " << (status.ready ? "yes" : "no") << "\n";
  if (!status.detail.empty()) {
    std::cout << "Detail: " << status.detail << "\n";
  }
  std::cout << "Embedding: " << engine.config().embedding.provider << " ("
            << engine.vector_index().dimension() << " dims)\n";
  std::cout << "Index: " << engine.vector_index().backend() << "\n";
  if (cp.ok()) {
    std::cout << "Config: " << cp.value().string() << "\n";
  }
  return status.ready ? 0 : 1;
}

int run_provider(std::vector<std::string> args) {
  auto engine_ptr = open_engine();
  if (engine_ptr == nullptr) {
    return 1;
  }
  auto &engine = *engine_ptr;
  if (args.empty()) {
    std::cout << engine.router().snapshot()->config.active << "\n";
    return 0;
  }
  auto switched = engine.router().switch_provider(args[0]);
  if (!switched.ok()) {
    return report_error("provider", switched.status());
  }
  std::cout << "Provider set to " << switched.value()->config.active << "\n";
  return 0;
}

int run_model(std::vector<std::string> args) {
  auto engine_ptr = open_engine();
  if (engine_ptr == nullptr) {
    return 1;
  }
  auto &engine = *engine_ptr;
  if (args.empty()) {
    std::cout << engine.router().status().model << "\n";
    return 0;
  }
  auto switched = engine.router().switch_model(join_tokens(args));
  if (!switched.ok()) {
    return report_error("model", switched.status());
  }
  const auto &provider = switched.value()->config;
  std::cout << "Model for " << provider.active << " set to "
            << (provider.active == "cloud" ? provider.cloud.model : provider.ollama.model) << "\n";
  return 0;
}

int run_models() {
  auto engine_ptr = open_engine();
  if (engine_ptr == nullptr) {
    return 1;
  }
  auto &engine = *engine_ptr;
  auto models = engine.router().list_models();
  if (!models.ok()) {
    return report_error("models", models.status());
  }
  for (const auto &model : models.value()) {
    std::cout << model << "\n";
  }
  return 0;
}

int run_sessions(std::vector<std::string> args) {
  auto engine_ptr = open_engine();
  if (engine_ptr == nullptr) {
    return 1;
  }
  auto &engine = *engine_ptr;
  const std::string action = args.empty() ? "list" : args[0];
  auto &store = engine.sessions();

  if (action == "list") {
    auto sessions = store.list();
    if (!sessions.ok()) {
      return report_error("sessions", sessions.status());
    }
    for (const auto &summary : sessions.value()) {
      std::cout << summary.session_id << "  turns=" << summary.turns << "  " << summary.updated_at
                << "\n";
    }
    return 0;
  }
  if (action == "show" && args.size() == 2) {
    auto turns = store.get(args[1]);
    if (!turns.ok()) {
      return report_error("sessions show", turns.status());
    }
    for (const auto &turn : turns.value()) {
      std::cout << "[" << turn.timestamp << "] Q: " << turn.query << "\n";
      std::cout << "A: " << turn.answer << "\n";
      for (const auto &citation : turn.citations) {
        std::cout << "   - " << citation.chunk_id << " (" << citation.score << ")\n";
      }
    }
    return 0;
  }
  if (action == "delete" && args.size() == 2) {
    if (auto status = store.remove(args[1]); !status.ok()) {
      return report_error("sessions delete", status);
    }
    std::cout << "Deleted session " << args[1] << "\n";
    return 0;
  }
  if (action == "clear") {
    if (auto status = store.clear_all(); !status.ok()) {
      return report_error("sessions clear", status);
    }
    std::cout << "All sessions deleted.\n";
    return 0;
  }
  std::cerr << "Usage: nexarag sessions [list|show ID|delete ID|clear]\n";
  return 1;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";
  constexpr const char *YELLOW = "\033[33m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  nexarag" << RESET << DIM
            << "  answers grounded in your documentation" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "nexarag [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  DOCUMENTS" << RESET << "\n";
  std::cout << "  " << GREEN << "ingest" << RESET << " PATHS" << DIM << "   Ingest files or directories (--version V, --tag T)" << RESET << "\n";
  std::cout << "  " << GREEN << "documents" << RESET << DIM << "      List ingested documents" << RESET << "\n";
  std::cout << "  " << GREEN << "remove" << RESET << " ID" << DIM << "      Delete a document (or --path SOURCE)" << RESET << "\n\n";

  std::cout << BOLD << "  QUESTIONS" << RESET << "\n";
  std::cout << "  " << GREEN << "ask" << RESET << " QUESTION" << DIM << "   Answer from the documentation (--session ID)" << RESET << "\n";
  std::cout << "  " << GREEN << "sessions" << RESET << DIM << "       List sessions (show ID, delete ID, clear)" << RESET << "\n\n";

  std::cout << BOLD << "  INDEX" << RESET << "\n";
  std::cout << "  " << GREEN << "stats" << RESET << DIM << "          Index and catalog statistics" << RESET << "\n";
  std::cout << "  " << GREEN << "rebuild" << RESET << DIM << "        Rebuild the index from the catalog" << RESET << "\n";
  std::cout << "  " << GREEN << "clear" << RESET << DIM << "          Remove all documents and vectors" << RESET << "\n\n";

  std::cout << BOLD << "  PROVIDERS" << RESET << "\n";
  std::cout << "  " << GREEN << "status" << RESET << DIM << "         Active provider and readiness" << RESET << "\n";
  std::cout << "  " << GREEN << "provider" << RESET << " NAME" << DIM << "  Show or switch provider (ollama, cloud)" << RESET << "\n";
  std::cout << "  " << GREEN << "model" << RESET << " NAME" << DIM << "     Show or switch the active model" << RESET << "\n";
  std::cout << "  " << GREEN << "models" << RESET << DIM << "         Models available on the active provider" << RESET << "\n\n";

  std::cout << BOLD << "  OTHER" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "    Print the config file location" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Print the version" << RESET << "\n\n";

  std::cout << YELLOW << "  Config: " << RESET << DIM << "~/.nexarag/config.toml, or NEXARAG_CONFIG_PATH" << RESET << "\n\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "ingest") {
    return run_ingest(std::move(args));
  }
  if (subcommand == "ask") {
    return run_ask(std::move(args));
  }
  if (subcommand == "documents") {
    return run_documents();
  }
  if (subcommand == "remove") {
    return run_remove(std::move(args));
  }
  if (subcommand == "stats") {
    return run_stats();
  }
  if (subcommand == "rebuild") {
    return run_rebuild();
  }
  if (subcommand == "clear") {
    return run_clear();
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "provider") {
    return run_provider(std::move(args));
  }
  if (subcommand == "model") {
    return run_model(std::move(args));
  }
  if (subcommand == "models") {
    return run_models();
  }
  if (subcommand == "sessions") {
    return run_sessions(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace nexarag::cli
