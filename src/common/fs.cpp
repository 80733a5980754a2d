#include "nexarag/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace nexarag::common {

std::string trim(const std::string &input) {
  const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
  const auto first = std::find_if(input.begin(), input.end(), not_space);
  const auto last = std::find_if(input.rbegin(), input.rend(), not_space).base();
  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure(ErrorCode::Configuration, "HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        ErrorCode::Io, "Failed to create directory: " + path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  static const std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::string expanded;
  auto begin = std::sregex_iterator(value.begin(), value.end(), env_pattern);
  std::size_t consumed = 0;
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    const auto &match = *it;
    expanded += value.substr(consumed, static_cast<std::size_t>(match.position()) - consumed);
    if (const char *var = std::getenv(match[1].str().c_str()); var != nullptr) {
      expanded += var;
    }
    consumed = static_cast<std::size_t>(match.position() + match.length());
  }
  expanded += value.substr(consumed);
  return expanded;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Result<std::string>::failure(ErrorCode::NotFound, "No such file: " + path.string());
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return Result<std::string>::failure(ErrorCode::Io, "Unable to open file: " + path.string());
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return Result<std::string>::failure(ErrorCode::Io, "Failed reading file: " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content) {
  if (!path.parent_path().empty()) {
    if (auto dir = ensure_dir(path.parent_path()); !dir.ok()) {
      return dir.status();
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      return Status::error(ErrorCode::Io, "Unable to write temporary file: " + tmp_path.string());
    }
    file << content;
    if (!file) {
      return Status::error(ErrorCode::Io, "Failed writing temporary file: " + tmp_path.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove(tmp_path, ec);
    return Status::error(ErrorCode::Io, "Failed to replace " + path.string() + ": " + reason);
  }
  return Status::success();
}

} // namespace nexarag::common
