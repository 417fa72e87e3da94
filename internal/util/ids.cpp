#include "ids.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace vera::util {

namespace {

std::mt19937_64& Rng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

} // namespace

UUID GenerateUUID() {
  auto& rng = Rng();

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

std::string NewRequestId() {
  return ToString(GenerateUUID());
}

std::string RandomHex(std::size_t length) {
  static constexpr char kHex[] = "0123456789abcdef";

  auto&       rng = Rng();
  std::string out;
  out.reserve(length);

  uint64_t bits      = 0;
  int      remaining = 0;
  for (std::size_t i = 0; i < length; ++i) {
    if (remaining == 0) {
      bits      = rng();
      remaining = 16;
    }
    out.push_back(kHex[bits & 0x0F]);
    bits >>= 4;
    --remaining;
  }
  return out;
}

std::string MakeId(std::string_view prefix, std::size_t suffix_length) {
  std::string id(prefix);
  id.push_back('-');
  id += RandomHex(suffix_length);
  return id;
}

} // namespace vera::util
