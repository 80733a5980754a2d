#pragma once

#include "nexarag/common/cancel.hpp"
#include "nexarag/providers/router.hpp"
#include "nexarag/rag/prompt.hpp"
#include "nexarag/rag/retrieval.hpp"
#include "nexarag/sessions/store.hpp"

#include <memory>
#include <string>
#include <vector>

namespace nexarag::rag {

struct Citation {
  std::string chunk_id;
  std::string document_id;
  std::string source_path;
  double score = 0.0;
};

struct Answer {
  std::string text;
  bool refused = false;
  std::vector<Citation> citations;
  std::vector<std::string> sources;
  std::string provider;
  std::string model;
  std::uint64_t config_version = 0;
};

class RagOrchestrator {
public:
  RagOrchestrator(std::shared_ptr<RetrievalPipeline> retrieval,
                  std::shared_ptr<providers::ProviderRouter> router,
                  std::shared_ptr<sessions::ISessionStore> sessions, PromptTemplates prompts);

  [[nodiscard]] common::Result<Answer> answer(const std::string &query,
                                              const std::string &session_id = "",
                                              const common::CancellationToken *cancel = nullptr);

private:
  void record_turn(const std::string &session_id, const std::string &query, const Answer &answer);

  std::shared_ptr<RetrievalPipeline> retrieval_;
  std::shared_ptr<providers::ProviderRouter> router_;
  std::shared_ptr<sessions::ISessionStore> sessions_;
  PromptTemplates prompts_;
};

} // namespace nexarag::rag
