#include "nexarag/index/vector_index.hpp"

#include "nexarag/index/flat_index.hpp"
#include "nexarag/index/qdrant_index.hpp"

#include <algorithm>
#include <cmath>

namespace nexarag::index {

std::vector<float> normalized(const std::vector<float> &values, double *norm) {
  double sum = 0.0;
  for (const float v : values) {
    sum += static_cast<double>(v) * static_cast<double>(v);
  }
  const double length = std::sqrt(sum);
  if (norm != nullptr) {
    *norm = length;
  }
  std::vector<float> out(values.size(), 0.0F);
  if (length < 1e-12) {
    return out;
  }
  for (std::size_t i = 0; i < values.size(); ++i) {
    out[i] = static_cast<float>(static_cast<double>(values[i]) / length);
  }
  return out;
}

double dot(const std::vector<float> &a, const std::vector<float> &b) {
  const std::size_t n = std::min(a.size(), b.size());
  double sum = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return sum;
}

common::Result<std::unique_ptr<IVectorIndex>>
create_vector_index(const config::IndexConfig &config, const std::size_t dimension,
                    std::shared_ptr<const VectorSource> source,
                    std::shared_ptr<providers::HttpClient> http_client) {
  using IndexResult = common::Result<std::unique_ptr<IVectorIndex>>;
  if (dimension == 0) {
    return IndexResult::failure(common::ErrorCode::Configuration,
                                "index dimension must be positive");
  }
  if (config.backend == "flat" || config.backend.empty()) {
    return IndexResult::success(std::make_unique<FlatVectorIndex>(dimension, std::move(source)));
  }
  if (config.backend == "qdrant") {
    if (http_client == nullptr) {
      return IndexResult::failure(common::ErrorCode::Configuration,
                                  "qdrant index requires an HTTP client");
    }
    QdrantOptions options{.base_url = config.qdrant_url,
                          .api_key = config.qdrant_api_key,
                          .collection = config.qdrant_collection,
                          .timeout_ms = config.timeout_ms};
    return IndexResult::success(std::make_unique<QdrantVectorIndex>(
        std::move(options), dimension, std::move(source), std::move(http_client)));
  }
  return IndexResult::failure(common::ErrorCode::Configuration,
                              "unknown index backend: " + config.backend);
}

} // namespace nexarag::index
