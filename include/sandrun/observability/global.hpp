#pragma once

#include "sandrun/observability/observer.hpp"

#include <memory>

namespace sandrun::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_sandbox_state(const std::string &sandbox_id, std::string_view from,
                          std::string_view to);
void record_run_start(const std::string &run_id, std::uint32_t attempt,
                      const std::string &sandbox_id);
void record_run_end(const std::string &run_id, const std::string &outcome,
                    std::chrono::milliseconds duration);
void record_duplicate_delivery(const std::string &run_id, std::int64_t delivery_id);
void record_requeue(const std::string &run_id, std::uint32_t next_attempt,
                    const std::string &reason);
void record_error(const std::string &component, const std::string &message);

} // namespace sandrun::observability
