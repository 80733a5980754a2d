#pragma once

#include "nexarag/observability/observer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace nexarag::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_error(const std::string &component, const std::string &message);
void record_latency(const std::string &operation, std::chrono::milliseconds latency);
void record_index_swap(const std::string &backend, const std::string &reason,
                       std::uint64_t generation, std::size_t entries);

class ScopedLatency {
public:
  explicit ScopedLatency(std::string operation)
      : operation_(std::move(operation)), started_(std::chrono::steady_clock::now()) {}
  ~ScopedLatency();

  ScopedLatency(const ScopedLatency &) = delete;
  ScopedLatency &operator=(const ScopedLatency &) = delete;

  [[nodiscard]] std::chrono::milliseconds elapsed() const;

private:
  std::string operation_;
  std::chrono::steady_clock::time_point started_;
};

} // namespace nexarag::observability
