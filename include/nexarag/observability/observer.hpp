#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace nexarag::observability {

struct IngestEvent {
  std::string source_path;
  std::string document_id;
  std::string status;
  std::size_t chunks = 0;
  std::chrono::milliseconds duration{0};
};

struct RetrievalEvent {
  std::size_t candidates = 0;
  std::size_t accepted = 0;
  double top_score = 0.0;
  bool refused = false;
};

struct GenerationEvent {
  std::string provider;
  std::string model;
  std::uint64_t config_version = 0;
  std::uint32_t attempts = 0;
  bool success = false;
  std::chrono::milliseconds duration{0};
};

struct IndexSwapEvent {
  std::string backend;
  std::string reason;
  std::uint64_t generation = 0;
  std::size_t entries = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<IngestEvent, RetrievalEvent, GenerationEvent, IndexSwapEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::string operation;
  std::chrono::milliseconds latency{0};
};

struct IndexSizeMetric {
  std::size_t entries = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, IndexSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace nexarag::observability
