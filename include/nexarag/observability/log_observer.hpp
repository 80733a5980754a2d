#pragma once

#include "nexarag/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace nexarag::observability {

class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(const char *level, const std::string &message);

  std::ostream *out_;
  std::mutex mutex_;
};

} // namespace nexarag::observability
