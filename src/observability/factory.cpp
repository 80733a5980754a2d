#include "nexarag/observability/factory.hpp"

#include "nexarag/common/fs.hpp"
#include "nexarag/observability/log_observer.hpp"

namespace nexarag::observability {

common::Result<std::unique_ptr<IObserver>>
create_observer(const config::ObservabilityConfig &config) {
  using ObserverResult = common::Result<std::unique_ptr<IObserver>>;
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend == "log") {
    return ObserverResult::success(std::make_unique<LogObserver>());
  }
  if (backend.empty() || backend == "none" || backend == "noop") {
    return ObserverResult::success(std::make_unique<NoopObserver>());
  }
  return ObserverResult::failure(common::ErrorCode::Configuration,
                                 "Invalid observability.backend: " + config.backend);
}

} // namespace nexarag::observability
