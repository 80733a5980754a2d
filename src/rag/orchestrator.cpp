#include "nexarag/rag/orchestrator.hpp"

#include "nexarag/common/fs.hpp"
#include "nexarag/observability/global.hpp"

#include <algorithm>
#include <filesystem>

namespace nexarag::rag {

namespace {

bool is_cancelled(const common::CancellationToken *cancel) {
  return cancel != nullptr && cancel->cancelled();
}

common::Result<Answer> cancelled() {
  return common::Result<Answer>::failure(common::ErrorCode::Cancelled, "request cancelled");
}

} // namespace

RagOrchestrator::RagOrchestrator(std::shared_ptr<RetrievalPipeline> retrieval,
                                 std::shared_ptr<providers::ProviderRouter> router,
                                 std::shared_ptr<sessions::ISessionStore> sessions,
                                 PromptTemplates prompts)
    : retrieval_(std::move(retrieval)), router_(std::move(router)),
      sessions_(std::move(sessions)), prompts_(std::move(prompts)) {}

common::Result<Answer> RagOrchestrator::answer(const std::string &query,
                                               const std::string &session_id,
                                               const common::CancellationToken *cancel) {
  const std::string question = common::trim(query);
  if (question.empty()) {
    return common::Result<Answer>::failure(common::ErrorCode::Configuration,
                                           "question must not be empty");
  }
  if (is_cancelled(cancel)) {
    return cancelled();
  }

  observability::ScopedLatency latency("answer");
  auto context = retrieval_->retrieve(question);
  if (!context.ok()) {
    observability::record_error("rag", "retrieval failed: " + context.error());
    return context.forward_error<Answer>();
  }
  if (is_cancelled(cancel)) {
    return cancelled();
  }

  Answer out;
  if (context.value().decision == RetrievalDecision::NoRelevantContext) {
    out.text = kRefusalText;
    out.refused = true;
    record_turn(session_id, question, out);
    return common::Result<Answer>::success(std::move(out));
  }

  for (const auto &chunk : context.value().chunks) {
    out.citations.push_back(Citation{.chunk_id = chunk.chunk_id,
                                     .document_id = chunk.document_id,
                                     .source_path = chunk.source_path,
                                     .score = chunk.score});
    const std::string name = chunk.source_path.empty()
                                 ? std::string("unknown")
                                 : std::filesystem::path(chunk.source_path).filename().string();
    if (std::find(out.sources.begin(), out.sources.end(), name) == out.sources.end()) {
      out.sources.push_back(name);
    }
  }

  providers::GenerationRequest request;
  request.system_prompt = prompts_.system_prompt;
  request.prompt = build_user_prompt(prompts_.rag_addon, context.value().context, question);
  request.cancel = cancel;

  auto generated = router_->generate(request);
  if (!generated.ok()) {
    if (generated.code() != common::ErrorCode::Cancelled) {
      observability::record_error("rag", "generation failed: " + generated.error());
    }
    return generated.forward_error<Answer>();
  }
  // The remote call may have completed after cancellation; its result is dropped.
  if (is_cancelled(cancel)) {
    return cancelled();
  }

  out.text = std::move(generated.value().text);
  out.provider = generated.value().provider;
  out.model = generated.value().model;
  out.config_version = generated.value().config_version;
  record_turn(session_id, question, out);
  return common::Result<Answer>::success(std::move(out));
}

void RagOrchestrator::record_turn(const std::string &session_id, const std::string &query,
                                  const Answer &answer) {
  if (session_id.empty() || sessions_ == nullptr) {
    return;
  }
  sessions::SessionTurn turn;
  turn.query = query;
  turn.answer = answer.text;
  turn.provider = answer.provider;
  turn.model = answer.model;
  for (const auto &citation : answer.citations) {
    turn.citations.push_back(sessions::SessionCitation{.chunk_id = citation.chunk_id,
                                                       .document_id = citation.document_id,
                                                       .source_path = citation.source_path,
                                                       .score = citation.score});
  }
  if (auto status = sessions_->append_turn(session_id, turn); !status.ok()) {
    observability::record_error("sessions", "append to " + session_id + " failed: " +
                                                status.error());
  }
}

} // namespace nexarag::rag
