#include "nexarag/sessions/session.hpp"

#include "nexarag/common/fs.hpp"
#include "nexarag/common/json_util.hpp"

#include <cstdlib>
#include <sstream>

namespace nexarag::sessions {

// Keys are written in a fixed order so each key's first occurrence is the key itself.
std::string encode_turn_jsonl(const SessionTurn &turn) {
  std::ostringstream out;
  out << "{";
  out << "\"timestamp\":\"" << common::json_escape(turn.timestamp) << "\",";
  out << "\"query\":\"" << common::json_escape(turn.query) << "\",";
  out << "\"answer\":\"" << common::json_escape(turn.answer) << "\",";
  out << "\"provider\":\"" << common::json_escape(turn.provider) << "\",";
  out << "\"model\":\"" << common::json_escape(turn.model) << "\",";
  out << "\"citations\":[";
  for (std::size_t i = 0; i < turn.citations.size(); ++i) {
    const auto &citation = turn.citations[i];
    if (i > 0) {
      out << ",";
    }
    out << "{\"chunk_id\":\"" << common::json_escape(citation.chunk_id) << "\",";
    out << "\"document_id\":\"" << common::json_escape(citation.document_id) << "\",";
    out << "\"source_path\":\"" << common::json_escape(citation.source_path) << "\",";
    out << "\"score\":" << citation.score << "}";
  }
  out << "]}";
  return out.str();
}

common::Result<SessionTurn> parse_turn_jsonl(const std::string &line) {
  if (common::trim(line).empty()) {
    return common::Result<SessionTurn>::failure("empty session line");
  }
  if (common::json_find_key(line, "query") == std::string::npos) {
    return common::Result<SessionTurn>::failure(common::ErrorCode::Storage,
                                                "session turn without query");
  }
  SessionTurn turn;
  turn.timestamp = common::json_get_string(line, "timestamp");
  turn.query = common::json_get_string(line, "query");
  turn.answer = common::json_get_string(line, "answer");
  turn.provider = common::json_get_string(line, "provider");
  turn.model = common::json_get_string(line, "model");
  for (const auto &item :
       common::json_split_top_level_objects(common::json_get_array(line, "citations"))) {
    SessionCitation citation;
    citation.chunk_id = common::json_get_string(item, "chunk_id");
    citation.document_id = common::json_get_string(item, "document_id");
    citation.source_path = common::json_get_string(item, "source_path");
    citation.score = std::strtod(common::json_get_number(item, "score").c_str(), nullptr);
    turn.citations.push_back(std::move(citation));
  }
  return common::Result<SessionTurn>::success(std::move(turn));
}

} // namespace nexarag::sessions
