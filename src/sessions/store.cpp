#include "nexarag/sessions/store.hpp"

#include "nexarag/common/time.hpp"
#include "nexarag/observability/global.hpp"

#include <algorithm>
#include <fstream>

namespace nexarag::sessions {

std::string sanitize_session_id(const std::string &session_id) {
  std::string out;
  out.reserve(session_id.size());
  for (const char ch : session_id) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
        ch == '-' || ch == '_') {
      out.push_back(ch);
    } else {
      out.push_back('_');
    }
  }
  if (out.empty()) {
    return "default";
  }
  return out;
}

FileSessionStore::FileSessionStore(std::filesystem::path root_dir)
    : root_dir_(std::move(root_dir)) {
  std::error_code ec;
  std::filesystem::create_directories(root_dir_, ec);
  if (ec) {
    observability::record_error("sessions", "cannot create " + root_dir_.string() + ": " +
                                                ec.message());
  }
}

std::filesystem::path FileSessionStore::session_path(const std::string &session_id) const {
  return root_dir_ / (sanitize_session_id(session_id) + ".jsonl");
}

common::Result<std::vector<SessionTurn>>
FileSessionStore::read_turns(const std::filesystem::path &path) const {
  std::ifstream in(path);
  if (!in) {
    return common::Result<std::vector<SessionTurn>>::failure(common::ErrorCode::NotFound,
                                                             "session not found");
  }
  std::vector<SessionTurn> turns;
  std::string line;
  while (std::getline(in, line)) {
    auto parsed = parse_turn_jsonl(line);
    if (!parsed.ok()) {
      continue;
    }
    turns.push_back(std::move(parsed.value()));
  }
  return common::Result<std::vector<SessionTurn>>::success(std::move(turns));
}

common::Status FileSessionStore::append_turn(const std::string &session_id,
                                             const SessionTurn &turn) {
  if (session_id.empty()) {
    return common::Status::error(common::ErrorCode::Configuration, "session_id is required");
  }
  SessionTurn stamped = turn;
  if (stamped.timestamp.empty()) {
    stamped.timestamp = common::now_rfc3339();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  std::filesystem::create_directories(root_dir_, ec);
  std::ofstream out(session_path(session_id), std::ios::app);
  if (!out) {
    return common::Status::error(common::ErrorCode::Io, "failed opening session file");
  }
  out << encode_turn_jsonl(stamped) << "\n";
  if (!out) {
    return common::Status::error(common::ErrorCode::Io, "failed appending session turn");
  }
  return common::Status::success();
}

common::Result<std::vector<SessionTurn>> FileSessionStore::get(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return read_turns(session_path(session_id));
}

common::Status FileSessionStore::remove(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  const bool removed = std::filesystem::remove(session_path(session_id), ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::Io, "failed removing session: " + ec.message());
  }
  if (!removed) {
    return common::Status::error(common::ErrorCode::NotFound, "session not found: " + session_id);
  }
  return common::Status::success();
}

common::Status FileSessionStore::clear_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  if (!std::filesystem::exists(root_dir_, ec)) {
    return common::Status::success();
  }
  std::vector<std::filesystem::path> files;
  for (std::filesystem::directory_iterator it(root_dir_, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->path().extension() == ".jsonl") {
      files.push_back(it->path());
    }
  }
  if (ec) {
    return common::Status::error(common::ErrorCode::Io, "failed listing sessions: " + ec.message());
  }
  for (const auto &file : files) {
    std::filesystem::remove(file, ec);
    if (ec) {
      return common::Status::error(common::ErrorCode::Io,
                                   "failed removing " + file.string() + ": " + ec.message());
    }
  }
  return common::Status::success();
}

common::Result<std::vector<SessionSummary>> FileSessionStore::list() const {
  using ListResult = common::Result<std::vector<SessionSummary>>;
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SessionSummary> out;
  std::error_code ec;
  if (!std::filesystem::exists(root_dir_, ec)) {
    return ListResult::success(std::move(out));
  }
  for (std::filesystem::directory_iterator it(root_dir_, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->path().extension() != ".jsonl") {
      continue;
    }
    auto turns = read_turns(it->path());
    if (!turns.ok()) {
      continue;
    }
    SessionSummary summary;
    summary.session_id = it->path().stem().string();
    summary.turns = turns.value().size();
    if (!turns.value().empty()) {
      summary.updated_at = turns.value().back().timestamp;
    }
    out.push_back(std::move(summary));
  }
  if (ec) {
    return ListResult::failure(common::ErrorCode::Io, "failed listing sessions: " + ec.message());
  }
  std::sort(out.begin(), out.end(), [](const SessionSummary &a, const SessionSummary &b) {
    if (a.updated_at != b.updated_at) {
      return a.updated_at > b.updated_at;
    }
    return a.session_id < b.session_id;
  });
  return ListResult::success(std::move(out));
}

} // namespace nexarag::sessions
