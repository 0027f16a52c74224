#include "sandrun/common/result.hpp"

namespace sandrun::common {

std::string_view error_kind_to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Generic:
    return "error";
  case ErrorKind::LaunchError:
    return "launch_error";
  case ErrorKind::HealthCheckTimeout:
    return "health_check_timeout";
  case ErrorKind::PoolExhausted:
    return "pool_exhausted";
  case ErrorKind::SandboxLost:
    return "sandbox_lost";
  case ErrorKind::ExecutionFault:
    return "execution_fault";
  case ErrorKind::NotReady:
    return "not_ready";
  case ErrorKind::InvalidPayload:
    return "invalid_payload";
  case ErrorKind::Cancelled:
    return "cancelled";
  case ErrorKind::Storage:
    return "storage";
  }
  return "error";
}

} // namespace sandrun::common
