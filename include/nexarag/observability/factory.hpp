#pragma once

#include "nexarag/common/result.hpp"
#include "nexarag/config/schema.hpp"
#include "nexarag/observability/observer.hpp"

#include <memory>

namespace nexarag::observability {

[[nodiscard]] common::Result<std::unique_ptr<IObserver>>
create_observer(const config::ObservabilityConfig &config);

} // namespace nexarag::observability
