#include "nexarag/observability/log_observer.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <type_traits>

namespace nexarag::observability {

namespace {

std::string bool_text(bool value) { return value ? "true" : "false"; }

std::string score_text(double score) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(4) << score;
  return out.str();
}

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const char *level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, IngestEvent>) {
          log_line(evt.status == "failed" ? "WARN" : "INFO",
                   "ingest." + evt.status + " path=" + evt.source_path +
                       " document=" + evt.document_id + " chunks=" + std::to_string(evt.chunks) +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, RetrievalEvent>) {
          log_line("INFO", "retrieval candidates=" + std::to_string(evt.candidates) +
                               " accepted=" + std::to_string(evt.accepted) +
                               " top_score=" + score_text(evt.top_score) +
                               " refused=" + bool_text(evt.refused));
        } else if constexpr (std::is_same_v<T, GenerationEvent>) {
          log_line(evt.success ? "INFO" : "WARN",
                   "generation provider=" + evt.provider + " model=" + evt.model +
                       " config_version=" + std::to_string(evt.config_version) +
                       " attempts=" + std::to_string(evt.attempts) +
                       " success=" + bool_text(evt.success) +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, IndexSwapEvent>) {
          log_line("INFO", "index.swap backend=" + evt.backend + " reason=" + evt.reason +
                               " generation=" + std::to_string(evt.generation) +
                               " entries=" + std::to_string(evt.entries));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line("DEBUG", "metric.latency_ms op=" + m.operation + " value=" +
                                std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, IndexSizeMetric>) {
          log_line("DEBUG", "metric.index_entries=" + std::to_string(m.entries));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace nexarag::observability
