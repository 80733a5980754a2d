#include "nexarag/common/toml.hpp"

#include "nexarag/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace nexarag::common {

namespace {

bool is_unescaped_quote(const std::string &text, std::size_t i) {
  return text[i] == '"' && (i == 0 || text[i - 1] != '\\');
}

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (is_unescaped_quote(line, i)) {
      in_quotes = !in_quotes;
    } else if (!in_quotes && line[i] == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }
  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    if (value[i] == '\\' && i + 2 < value.size()) {
      const char next = value[++i];
      out.push_back(next == 'n' ? '\n' : next == 't' ? '\t' : next);
      continue;
    }
    out.push_back(value[i]);
  }
  return out;
}

template <typename T> T parse_number(const std::string &raw, T fallback) {
  const std::string normalized = trim(raw);
  T parsed{};
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }
  return parsed;
}

} // namespace

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : parse_number<std::uint64_t>(it->second, fallback);
}

std::uint32_t TomlDocument::get_u32(const std::string &key, std::uint32_t fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : parse_number<std::uint32_t>(it->second, fallback);
}

std::size_t TomlDocument::get_size(const std::string &key, std::size_t fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : parse_number<std::size_t>(it->second, fallback);
}

double TomlDocument::get_double(const std::string &key, double fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : parse_number<double>(it->second, fallback);
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(strip_comment(line));
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[' && clean.back() == ']') {
      section = trim(clean.substr(1, clean.size() - 2));
      if (section.empty()) {
        return Result<TomlDocument>::failure(ErrorCode::Configuration,
                                             "Invalid empty section at line " +
                                                 std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(ErrorCode::Configuration,
                                           "Invalid key/value at line " +
                                               std::to_string(line_number));
    }
    const std::string key = trim(clean.substr(0, equals));
    if (key.empty()) {
      return Result<TomlDocument>::failure(ErrorCode::Configuration,
                                           "Missing key at line " + std::to_string(line_number));
    }
    document.values[section.empty() ? key : section + "." + key] =
        trim(clean.substr(equals + 1));
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped = "\"";
  for (const char ch : value) {
    if (ch == '\n') {
      escaped += "\\n";
      continue;
    }
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace nexarag::common
