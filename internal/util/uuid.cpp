#include "uuid.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace tablebook::util {

namespace {

std::mt19937_64& Rng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

} // namespace

std::string GenerateId() {
  static constexpr char kHex[] = "0123456789abcdef";

  std::array<uint8_t, 16> bytes{};
  std::uniform_int_distribution<unsigned> byte(0, 255);
  for (auto& b : bytes)
    b = static_cast<uint8_t>(byte(Rng()));

  // RFC4122 variant + version 4
  bytes[6] = (bytes[6] & 0x0F) | 0x40;
  bytes[8] = (bytes[8] & 0x3F) | 0x80;

  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[bytes[i] >> 4]);
    out.push_back(kHex[bytes[i] & 0x0F]);
  }
  return out;
}

std::string GenerateConfirmationCode() {
  static constexpr char kAlphabet[] = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
  std::uniform_int_distribution<size_t> pick(0, sizeof(kAlphabet) - 2);

  std::string code(8, ' ');
  for (auto& c : code)
    c = kAlphabet[pick(Rng())];
  return code;
}

} // namespace tablebook::util
