#pragma once

#include <cstddef>
#include <string>

namespace sandrun::common {

[[nodiscard]] std::string random_hex(std::size_t bytes);

[[nodiscard]] std::string make_id(const std::string &prefix, std::size_t bytes = 4);

} // namespace sandrun::common
