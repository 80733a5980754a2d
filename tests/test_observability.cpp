#include "test_framework.hpp"

#include "nexarag/observability/factory.hpp"
#include "nexarag/observability/global.hpp"
#include "nexarag/observability/log_observer.hpp"

#include <sstream>

namespace {

namespace observability = nexarag::observability;

class CountingObserver final : public observability::IObserver {
public:
  explicit CountingObserver(std::shared_ptr<std::vector<std::string>> seen) : seen_(std::move(seen)) {}

  void record_event(const observability::ObserverEvent &event) override {
    if (const auto *error = std::get_if<observability::ErrorEvent>(&event)) {
      seen_->push_back("error:" + error->component);
    } else {
      seen_->push_back("event");
    }
  }
  void record_metric(const observability::ObserverMetric &metric) override {
    if (const auto *latency = std::get_if<observability::RequestLatencyMetric>(&metric)) {
      seen_->push_back("latency:" + latency->operation);
    } else {
      seen_->push_back("metric");
    }
  }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  std::shared_ptr<std::vector<std::string>> seen_;
};

// Restores a silent global observer when a test ends.
struct GlobalObserverGuard {
  ~GlobalObserverGuard() {
    observability::set_global_observer(std::make_unique<observability::NoopObserver>());
  }
};

} // namespace

void register_observability_tests(std::vector<nexarag::tests::TestCase> &tests) {
  using nexarag::tests::require;

  tests.push_back({"log_observer_formats_events", [] {
                     std::ostringstream out;
                     observability::LogObserver observer(out);
                     observer.record_event(observability::RetrievalEvent{
                         .candidates = 4, .accepted = 2, .top_score = 0.5, .refused = false});
                     observer.record_event(observability::IngestEvent{.source_path = "/docs/a.md",
                                                                      .document_id = "",
                                                                      .status = "failed",
                                                                      .chunks = 0,
                                                                      .duration = {}});
                     observer.record_event(observability::IndexSwapEvent{
                         .backend = "flat", .reason = "rebuild", .generation = 3, .entries = 10});
                     observer.record_metric(observability::IndexSizeMetric{.entries = 10});
                     observer.flush();
                     const std::string text = out.str();
                     require(text.find("[INFO] retrieval candidates=4 accepted=2 top_score=0.5000 "
                                       "refused=false\n") != std::string::npos,
                             "retrieval line");
                     require(text.find("[WARN] ingest.failed path=/docs/a.md") != std::string::npos,
                             "failed ingest is a warning");
                     require(text.find("index.swap backend=flat reason=rebuild generation=3 entries=10") !=
                                 std::string::npos,
                             "swap line");
                     require(text.find("[DEBUG] metric.index_entries=10") != std::string::npos,
                             "metric line");
                   }});

  tests.push_back({"global_observer_receives_errors_and_latency", [] {
                     GlobalObserverGuard guard;
                     auto seen = std::make_shared<std::vector<std::string>>();
                     observability::set_global_observer(std::make_unique<CountingObserver>(seen));
                     observability::record_error("index", "boom");
                     observability::record_latency("answer", std::chrono::milliseconds(12));
                     require(*seen == std::vector<std::string>({"error:index", "latency:answer"}),
                             "forwarded in order");
                     require(observability::get_global_observer()->name() == "counting",
                             "installed observer");
                   }});

  tests.push_back({"scoped_latency_and_index_swap_helpers", [] {
                     GlobalObserverGuard guard;
                     auto seen = std::make_shared<std::vector<std::string>>();
                     observability::set_global_observer(std::make_unique<CountingObserver>(seen));
                     {
                       observability::ScopedLatency latency("retrieve");
                       require(latency.elapsed().count() >= 0, "elapsed");
                       require(seen->empty(), "nothing recorded before scope exit");
                     }
                     observability::record_index_swap("flat", "rebuild", 4, 12);
                     require(*seen == std::vector<std::string>({"latency:retrieve", "event", "metric"}),
                             "latency on exit, then swap event and size metric");
                   }});

  tests.push_back({"global_observer_absent_is_silent", [] {
                     GlobalObserverGuard guard;
                     observability::set_global_observer(nullptr);
                     observability::record_error("index", "nobody listens");
                     require(observability::get_global_observer() == nullptr, "no observer");
                   }});

  tests.push_back({"create_observer_selects_backend", [] {
                     nexarag::config::ObservabilityConfig config;
                     const auto log = observability::create_observer(config);
                     require(log.ok() && log.value()->name() == "log", "log default");
                     config.backend = "none";
                     const auto none = observability::create_observer(config);
                     require(none.ok() && none.value()->name() == "noop", "none");
                     config.backend = " NOOP ";
                     const auto noop = observability::create_observer(config);
                     require(noop.ok() && noop.value()->name() == "noop", "noop alias");
                     config.backend = "statsd";
                     require(observability::create_observer(config).code() ==
                                 nexarag::common::ErrorCode::Configuration,
                             "unknown backend rejected");
                   }});
}
