#include "sandrun/observability/global.hpp"

#include <mutex>

namespace sandrun::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_sandbox_state(const std::string &sandbox_id, const std::string_view from,
                          const std::string_view to) {
  record_event(SandboxStateEvent{
      .sandbox_id = sandbox_id, .from = std::string(from), .to = std::string(to)});
}

void record_run_start(const std::string &run_id, const std::uint32_t attempt,
                      const std::string &sandbox_id) {
  record_event(RunStartEvent{.run_id = run_id, .attempt = attempt, .sandbox_id = sandbox_id});
}

void record_run_end(const std::string &run_id, const std::string &outcome,
                    const std::chrono::milliseconds duration) {
  record_event(RunEndEvent{.run_id = run_id, .outcome = outcome, .duration = duration});
  record_metric(RunLatencyMetric{.latency = duration});
}

void record_duplicate_delivery(const std::string &run_id, const std::int64_t delivery_id) {
  record_event(DuplicateDeliveryEvent{.run_id = run_id, .delivery_id = delivery_id});
}

void record_requeue(const std::string &run_id, const std::uint32_t next_attempt,
                    const std::string &reason) {
  record_event(RequeueEvent{.run_id = run_id, .next_attempt = next_attempt, .reason = reason});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace sandrun::observability
