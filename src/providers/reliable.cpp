#include "nexarag/providers/reliable.hpp"

#include "nexarag/common/time.hpp"
#include "nexarag/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace nexarag::providers {

namespace {

constexpr std::uint64_t kSleepSliceMs = 25;

// Sleeps up to `delay_ms`, returning early once the request is cancelled.
void backoff(const std::uint64_t delay_ms, const common::CancellationToken *cancel) {
  std::uint64_t slept = 0;
  while (slept < delay_ms) {
    if (cancel != nullptr && cancel->cancelled()) {
      return;
    }
    const std::uint64_t step = std::min(kSleepSliceMs, delay_ms - slept);
    std::this_thread::sleep_for(std::chrono::milliseconds(step));
    slept += step;
  }
}

} // namespace

ReliableProvider::ReliableProvider(std::shared_ptr<Provider> inner,
                                   const std::uint32_t max_retries, const std::uint64_t backoff_ms,
                                   const std::uint64_t config_version)
    : inner_(std::move(inner)), max_retries_(max_retries), backoff_ms_(backoff_ms),
      config_version_(config_version) {}

common::Result<std::string> ReliableProvider::generate(const GenerationRequest &request) {
  const auto started = std::chrono::steady_clock::now();
  const auto report = [&](const std::uint32_t attempts, const bool success) {
    observability::record_event(observability::GenerationEvent{
        .provider = inner_->name(),
        .model = inner_->model(),
        .config_version = config_version_,
        .attempts = attempts,
        .success = success,
        .duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started)});
  };

  for (std::uint32_t attempt = 0;; ++attempt) {
    if (request.cancel != nullptr && request.cancel->cancelled()) {
      report(attempt, false);
      return common::Result<std::string>::failure(common::ErrorCode::Cancelled,
                                                  "generation cancelled");
    }

    auto result = inner_->generate(request);
    if (result.ok()) {
      report(attempt + 1, true);
      return result;
    }

    const auto code = result.code();
    if (code == common::ErrorCode::Configuration || code == common::ErrorCode::Cancelled) {
      report(attempt + 1, false);
      return result;
    }
    if (!common::is_retryable(code) || attempt >= max_retries_) {
      report(attempt + 1, false);
      return common::Result<std::string>::failure(
          common::ErrorCode::GenerationFailed,
          "generation via " + inner_->name() + " failed after " + std::to_string(attempt + 1) +
              " attempt(s): " + result.error());
    }
    backoff(common::backoff_delay_ms(backoff_ms_, attempt), request.cancel);
  }
}

ProviderStatus ReliableProvider::status() { return inner_->status(); }

common::Result<std::vector<std::string>> ReliableProvider::list_models() {
  return inner_->list_models();
}

std::string ReliableProvider::name() const { return inner_->name(); }

std::string ReliableProvider::model() const { return inner_->model(); }

} // namespace nexarag::providers
