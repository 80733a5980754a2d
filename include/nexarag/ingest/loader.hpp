#pragma once

#include "nexarag/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace nexarag::ingest {

class IFileLoader {
public:
  virtual ~IFileLoader() = default;

  [[nodiscard]] virtual common::Result<std::string> load(const std::filesystem::path &path) = 0;
  [[nodiscard]] virtual bool supports(const std::filesystem::path &path) const = 0;
};

class FileLoader final : public IFileLoader {
public:
  [[nodiscard]] common::Result<std::string> load(const std::filesystem::path &path) override;
  [[nodiscard]] bool supports(const std::filesystem::path &path) const override;
};

struct SourceError {
  std::string path;
  common::ErrorCode code = common::ErrorCode::Internal;
  std::string message;
};

struct GatheredSources {
  std::vector<std::filesystem::path> files;
  std::vector<SourceError> errors;
};

[[nodiscard]] GatheredSources gather_sources(const std::vector<std::string> &paths,
                                             const IFileLoader &loader);

[[nodiscard]] bool is_valid_utf8(const std::string &text);

} // namespace nexarag::ingest
