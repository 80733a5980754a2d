#include "nexarag/rag/prompt.hpp"

#include "nexarag/common/fs.hpp"

namespace nexarag::rag {

PromptTemplates default_prompts() {
  return PromptTemplates{
      .system_prompt =
          "You are a documentation assistant. Answer only from the provided context. "
          "If the context does not contain the answer, say that the information is not "
          "available in the documentation. Do not invent commands, paths or settings.",
      .rag_addon = "Use the context below to answer the user's question. Cite commands and "
                   "file names exactly as they appear."};
}

common::Result<PromptTemplates> load_prompts(const config::RagConfig &config) {
  auto prompts = default_prompts();
  if (!config.system_prompt_path.empty()) {
    auto text = common::read_file(common::expand_path(config.system_prompt_path));
    if (!text.ok()) {
      return common::Result<PromptTemplates>::failure(
          common::ErrorCode::Configuration, "system prompt: " + text.error());
    }
    prompts.system_prompt = common::trim(text.value());
  }
  if (!config.rag_prompt_path.empty()) {
    auto text = common::read_file(common::expand_path(config.rag_prompt_path));
    if (!text.ok()) {
      return common::Result<PromptTemplates>::failure(common::ErrorCode::Configuration,
                                                      "rag prompt: " + text.error());
    }
    prompts.rag_addon = common::trim(text.value());
  }
  return common::Result<PromptTemplates>::success(std::move(prompts));
}

std::string build_user_prompt(const std::string &rag_addon, const std::string &context,
                              const std::string &question) {
  return rag_addon + "\nContext:\n" + context + "\n\nUser question: " + question +
         "\nAnswer concisely using only the context.";
}

} // namespace nexarag::rag
