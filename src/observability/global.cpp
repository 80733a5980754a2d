#include "nexarag/observability/global.hpp"

#include <mutex>
#include <utility>

namespace nexarag::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> previous;
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    previous = std::exchange(g_observer, std::move(observer));
  }
  if (previous != nullptr) {
    previous->flush();
  }
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_latency(const std::string &operation, std::chrono::milliseconds latency) {
  record_metric(RequestLatencyMetric{.operation = operation, .latency = latency});
}

void record_index_swap(const std::string &backend, const std::string &reason,
                       const std::uint64_t generation, const std::size_t entries) {
  const auto observer = get_global_observer();
  if (observer == nullptr) {
    return;
  }
  observer->record_event(IndexSwapEvent{
      .backend = backend, .reason = reason, .generation = generation, .entries = entries});
  observer->record_metric(IndexSizeMetric{.entries = entries});
}

ScopedLatency::~ScopedLatency() { record_latency(operation_, elapsed()); }

std::chrono::milliseconds ScopedLatency::elapsed() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               started_);
}

} // namespace nexarag::observability
