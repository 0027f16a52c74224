#include "sandrun/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace sandrun::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SandboxStateEvent>) {
          log_line("DEBUG", "sandbox.state id=" + evt.sandbox_id + " from=" + evt.from +
                                " to=" + evt.to);
        } else if constexpr (std::is_same_v<T, RunStartEvent>) {
          log_line("INFO", "run.start run_id=" + evt.run_id +
                               " attempt=" + std::to_string(evt.attempt) +
                               " sandbox=" + evt.sandbox_id);
        } else if constexpr (std::is_same_v<T, RunEndEvent>) {
          log_line("INFO", "run.end run_id=" + evt.run_id + " outcome=" + evt.outcome +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, DuplicateDeliveryEvent>) {
          log_line("WARN", "queue.duplicate run_id=" + evt.run_id +
                               " delivery=" + std::to_string(evt.delivery_id));
        } else if constexpr (std::is_same_v<T, RequeueEvent>) {
          log_line("WARN", "queue.requeue run_id=" + evt.run_id +
                               " next_attempt=" + std::to_string(evt.next_attempt) +
                               " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, PoolSizeMetric>) {
          log_line("DEBUG", "metric.pool total=" + std::to_string(m.total) +
                                " ready=" + std::to_string(m.ready) +
                                " in_use=" + std::to_string(m.in_use));
        } else if constexpr (std::is_same_v<T, InFlightRunsMetric>) {
          log_line("DEBUG", "metric.in_flight_runs=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, RunLatencyMetric>) {
          log_line("DEBUG", "metric.run_latency_ms=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

} // namespace sandrun::observability
