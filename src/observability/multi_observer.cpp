#include "sandrun/observability/multi_observer.hpp"

#include <iostream>

namespace sandrun::observability {

namespace {

// A failing backend must not keep the others (or the recording thread) from running.
template <typename Fn>
void dispatch(std::vector<std::unique_ptr<IObserver>> &observers, const char *what, Fn &&fn) {
  for (auto &observer : observers) {
    try {
      fn(*observer);
    } catch (const std::exception &ex) {
      std::cerr << "[observability] " << observer->name() << " " << what
                << " failed: " << ex.what() << "\n";
    }
  }
}

} // namespace

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  dispatch(observers_, "event", [&event](IObserver &observer) { observer.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  dispatch(observers_, "metric",
           [&metric](IObserver &observer) { observer.record_metric(metric); });
}

void MultiObserver::flush() {
  dispatch(observers_, "flush", [](IObserver &observer) { observer.flush(); });
}

} // namespace sandrun::observability
