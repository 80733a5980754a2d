#pragma once

#include "nexarag/common/result.hpp"

#include <string>
#include <vector>

namespace nexarag::sessions {

struct SessionCitation {
  std::string chunk_id;
  std::string document_id;
  std::string source_path;
  double score = 0.0;
};

struct SessionTurn {
  std::string timestamp;
  std::string query;
  std::string answer;
  std::string provider;
  std::string model;
  std::vector<SessionCitation> citations;
};

struct SessionSummary {
  std::string session_id;
  std::size_t turns = 0;
  std::string updated_at;
};

[[nodiscard]] std::string encode_turn_jsonl(const SessionTurn &turn);
[[nodiscard]] common::Result<SessionTurn> parse_turn_jsonl(const std::string &line);

} // namespace nexarag::sessions
