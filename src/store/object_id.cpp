#include "store/object_id.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>

namespace gridstore::store {

namespace {

// Process-unique component, drawn once
const std::vector<uint8_t>& process_bytes() {
  static const std::vector<uint8_t> bytes = crypto::random_bytes(5);
  return bytes;
}

uint32_t initial_counter() {
  auto seed = crypto::random_bytes(3);
  return (static_cast<uint32_t>(seed[0]) << 16) |
         (static_cast<uint32_t>(seed[1]) << 8) |
         static_cast<uint32_t>(seed[2]);
}

} // namespace

std::string generate_object_id() {
  static std::atomic<uint32_t> counter{initial_counter()};

  auto now = std::chrono::system_clock::now().time_since_epoch();
  auto seconds = static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
  uint32_t count = counter.fetch_add(1) & 0xFFFFFF;

  std::array<uint8_t, 12> id{};
  // Timestamp, big endian
  id[0] = static_cast<uint8_t>(seconds >> 24);
  id[1] = static_cast<uint8_t>(seconds >> 16);
  id[2] = static_cast<uint8_t>(seconds >> 8);
  id[3] = static_cast<uint8_t>(seconds);

  const auto& process = process_bytes();
  std::copy(process.begin(), process.end(), id.begin() + 4);

  // Counter, big endian
  id[9] = static_cast<uint8_t>(count >> 16);
  id[10] = static_cast<uint8_t>(count >> 8);
  id[11] = static_cast<uint8_t>(count);

  return crypto::to_hex(id.data(), id.size());
}

} // namespace gridstore::store
