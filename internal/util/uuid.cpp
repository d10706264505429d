#include "uuid.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>

namespace freightline::util {

namespace {

constexpr char kHex[] = "0123456789abcdef";

std::array<std::uint8_t, 16> RandomBytes() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::array<std::uint8_t, 16> bytes{};
  for (std::size_t i = 0; i < bytes.size(); i += 8) {
    auto word = rng();
    for (std::size_t j = 0; j < 8; ++j, word >>= 8)
      bytes[i + j] = static_cast<std::uint8_t>(word & 0xFF);
  }
  return bytes;
}

} // namespace

std::string NewId() {
  auto bytes = RandomBytes();
  bytes[6]   = (bytes[6] & 0x0F) | 0x40; // version 4
  bytes[8]   = (bytes[8] & 0x3F) | 0x80; // RFC4122 variant

  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[bytes[i] >> 4]);
    out.push_back(kHex[bytes[i] & 0x0F]);
  }
  return out;
}

} // namespace freightline::util
