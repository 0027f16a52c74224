#pragma once

#include "sandrun/config/schema.hpp"
#include "sandrun/observability/observer.hpp"

#include <memory>

namespace sandrun::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace sandrun::observability
