#pragma once

#include "nexarag/common/result.hpp"
#include "nexarag/sessions/session.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace nexarag::sessions {

class ISessionStore {
public:
  virtual ~ISessionStore() = default;

  [[nodiscard]] virtual common::Status append_turn(const std::string &session_id,
                                                   const SessionTurn &turn) = 0;
  [[nodiscard]] virtual common::Result<std::vector<SessionTurn>>
  get(const std::string &session_id) const = 0;
  [[nodiscard]] virtual common::Status remove(const std::string &session_id) = 0;
  [[nodiscard]] virtual common::Status clear_all() = 0;
  [[nodiscard]] virtual common::Result<std::vector<SessionSummary>> list() const = 0;
};

class FileSessionStore final : public ISessionStore {
public:
  explicit FileSessionStore(std::filesystem::path root_dir);

  [[nodiscard]] common::Status append_turn(const std::string &session_id,
                                           const SessionTurn &turn) override;
  [[nodiscard]] common::Result<std::vector<SessionTurn>>
  get(const std::string &session_id) const override;
  [[nodiscard]] common::Status remove(const std::string &session_id) override;
  [[nodiscard]] common::Status clear_all() override;
  [[nodiscard]] common::Result<std::vector<SessionSummary>> list() const override;

private:
  [[nodiscard]] std::filesystem::path session_path(const std::string &session_id) const;
  [[nodiscard]] common::Result<std::vector<SessionTurn>>
  read_turns(const std::filesystem::path &path) const;

  std::filesystem::path root_dir_;
  mutable std::mutex mutex_;
};

[[nodiscard]] std::string sanitize_session_id(const std::string &session_id);

} // namespace nexarag::sessions
