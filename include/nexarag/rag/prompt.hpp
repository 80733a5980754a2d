#pragma once

#include "nexarag/common/result.hpp"
#include "nexarag/config/schema.hpp"

#include <string>

namespace nexarag::rag {

inline constexpr const char *kRefusalText =
    "I can only help with questions related to the ingested documentation. "
    "This information is not available in the documentation.";

struct PromptTemplates {
  std::string system_prompt;
  std::string rag_addon;
};

[[nodiscard]] PromptTemplates default_prompts();

[[nodiscard]] common::Result<PromptTemplates> load_prompts(const config::RagConfig &config);

[[nodiscard]] std::string build_user_prompt(const std::string &rag_addon,
                                            const std::string &context,
                                            const std::string &question);

} // namespace nexarag::rag
