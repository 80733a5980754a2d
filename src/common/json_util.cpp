#include "nexarag/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <sstream>

namespace nexarag::common {

namespace {

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::optional<std::uint32_t> parse_hex4(const std::string &raw, std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  const auto [ptr, ec] = std::from_chars(raw.data() + pos, raw.data() + pos + 4, value, 16);
  if (ec != std::errc() || ptr != raw.data() + pos + 4) {
    return std::nullopt;
  }
  return value;
}

// Position of the first character of the value bound to `field`, or npos.
// Matches of the quoted name that are string values, not keys, are skipped.
std::size_t locate_value(const std::string &json, const std::string &field) {
  std::size_t key_pos = json_find_key(json, field);
  while (key_pos != std::string::npos) {
    const auto colon = json_skip_ws(json, key_pos + field.size() + 2);
    if (colon < json.size() && json[colon] == ':') {
      const auto pos = json_skip_ws(json, colon + 1);
      return pos < json.size() ? pos : std::string::npos;
    }
    key_pos = json_find_key(json, field, key_pos + 1);
  }
  return std::string::npos;
}

std::string extract_nested(const std::string &json, const std::string &field, char open_ch,
                           char close_ch) {
  const auto pos = locate_value(json, field);
  if (pos == std::string::npos || json[pos] != open_ch) {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, open_ch, close_ch);
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

bool is_value_terminator(char ch) {
  return ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      auto cp = parse_hex4(raw, i + 1);
      if (!cp.has_value()) {
        out.push_back(next);
        break;
      }
      i += 4;
      std::uint32_t code = *cp;
      if (code >= 0xD800 && code <= 0xDBFF && i + 6 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        if (auto low = parse_hex4(raw, i + 3); low.has_value() && *low >= 0xDC00 &&
                                               *low <= 0xDFFF) {
          code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_find_key(const std::string &json, const std::string &key, std::size_t from) {
  return json.find("\"" + key + "\"", from);
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    if (json[i] == '\\') {
      ++i;
      continue;
    }
    if (json[i] == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      i = json_find_string_end(json, i);
      if (i == std::string::npos) {
        return std::string::npos;
      }
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (--depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto pos = locate_value(json, field);
  if (pos == std::string::npos || json[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const auto start = locate_value(json, field);
  if (start == std::string::npos || json[start] == '"') {
    return "";
  }
  std::size_t pos = start;
  while (pos < json.size() && !is_value_terminator(json[pos])) {
    ++pos;
  }
  return json.substr(start, pos - start);
}

std::optional<bool> json_get_bool(const std::string &json, const std::string &field) {
  const auto pos = locate_value(json, field);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  if (json.compare(pos, 4, "true") == 0) {
    return true;
  }
  if (json.compare(pos, 5, "false") == 0) {
    return false;
  }
  return std::nullopt;
}

std::string json_get_object(const std::string &json, const std::string &field) {
  return extract_nested(json, field, '{', '}');
}

std::string json_get_array(const std::string &json, const std::string &field) {
  return extract_nested(json, field, '[', ']');
}

std::vector<std::string> json_get_string_array(const std::string &json, const std::string &field) {
  const std::string array_str = json_get_array(json, field);
  std::vector<std::string> out;
  std::size_t pos = 1;
  while (pos < array_str.size()) {
    pos = json_skip_ws(array_str, pos);
    if (pos >= array_str.size() || array_str[pos] == ']') {
      break;
    }
    if (array_str[pos] != '"') {
      ++pos;
      continue;
    }
    const auto end = json_find_string_end(array_str, pos);
    if (end == std::string::npos) {
      break;
    }
    out.push_back(json_unescape(array_str.substr(pos + 1, end - pos - 1)));
    pos = end + 1;
  }
  return out;
}

std::optional<std::vector<float>> json_parse_float_array(const std::string &array_json) {
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return std::nullopt;
  }
  std::vector<float> values;
  std::size_t pos = 1;
  const std::size_t end = array_json.size() - 1;
  while (true) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= end) {
      break;
    }
    std::size_t stop = pos;
    while (stop < end && !is_value_terminator(array_json[stop])) {
      ++stop;
    }
    float value = 0.0F;
    const auto [ptr, ec] = std::from_chars(array_json.data() + pos, array_json.data() + stop, value);
    if (ec != std::errc() || ptr != array_json.data() + stop) {
      return std::nullopt;
    }
    values.push_back(value);
    pos = json_skip_ws(array_json, stop);
    if (pos < end) {
      if (array_json[pos] != ',') {
        return std::nullopt;
      }
      ++pos;
    }
  }
  return values;
}

std::vector<std::string> json_split_top_level(const std::string &array_json, const char open_ch,
                                              const char close_ch) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }
  for (std::size_t i = 1; i + 1 < array_json.size(); ++i) {
    const char ch = array_json[i];
    if (ch == '"') {
      i = json_find_string_end(array_json, i);
      if (i == std::string::npos) {
        break;
      }
      continue;
    }
    if (ch != open_ch) {
      continue;
    }
    const auto end = json_find_matching_token(array_json, i, open_ch, close_ch);
    if (end == std::string::npos) {
      break;
    }
    out.push_back(array_json.substr(i, end - i + 1));
    i = end;
  }
  return out;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  return json_split_top_level(array_json, '{', '}');
}

std::string json_float_array(const std::vector<float> &values) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    char buf[32];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), values[i]);
    out.write(buf, ec == std::errc() ? ptr - buf : 0);
  }
  out << ']';
  return out.str();
}

} // namespace nexarag::common
