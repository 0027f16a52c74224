#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace sandrun::observability {

struct SandboxStateEvent {
  std::string sandbox_id;
  std::string from;
  std::string to;
};

struct RunStartEvent {
  std::string run_id;
  std::uint32_t attempt = 1;
  std::string sandbox_id;
};

struct RunEndEvent {
  std::string run_id;
  std::string outcome;
  std::chrono::milliseconds duration{0};
};

struct DuplicateDeliveryEvent {
  std::string run_id;
  std::int64_t delivery_id = 0;
};

struct RequeueEvent {
  std::string run_id;
  std::uint32_t next_attempt = 0;
  std::string reason;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<SandboxStateEvent, RunStartEvent, RunEndEvent,
                                   DuplicateDeliveryEvent, RequeueEvent, ErrorEvent>;

struct PoolSizeMetric {
  std::uint64_t total = 0;
  std::uint64_t ready = 0;
  std::uint64_t in_use = 0;
};

struct InFlightRunsMetric {
  std::uint64_t count = 0;
};

struct RunLatencyMetric {
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<PoolSizeMetric, InFlightRunsMetric, RunLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sandrun::observability
