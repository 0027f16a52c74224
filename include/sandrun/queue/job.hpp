#pragma once

#include <cstdint>
#include <string>

namespace sandrun::queue {

struct Job {
  std::string run_id;
  std::string payload;
  std::int64_t enqueued_at_ms = 0;
  std::uint32_t attempt = 1;
};

/// A job as handed out by the queue. `delivery_id` identifies this delivery, not the run:
/// a run submitted twice is delivered twice under different ids.
struct Delivery {
  std::int64_t delivery_id = 0;
  Job job;
};

} // namespace sandrun::queue
