#include "sandrun/common/ids.hpp"

#include <iomanip>
#include <openssl/rand.h>
#include <random>
#include <sstream>
#include <vector>

namespace sandrun::common {

std::string random_hex(std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    std::random_device device;
    for (auto &byte : data) {
      byte = static_cast<unsigned char>(device() & 0xFFU);
    }
  }

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const auto byte : data) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return stream.str();
}

std::string make_id(const std::string &prefix, const std::size_t bytes) {
  return prefix + "-" + random_hex(bytes);
}

} // namespace sandrun::common
