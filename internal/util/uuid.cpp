#include "uuid.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace vkyc::util {

namespace {

constexpr char kTokenAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr char kHex[]           = "0123456789abcdef";

} // namespace

std::string GenerateSessionId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::array<std::uint8_t, 16> bytes{};
  for (std::size_t i = 0; i < bytes.size(); i += 8) {
    const auto word = rng();
    for (std::size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<std::uint8_t>(word >> (j * 8));
    }
  }
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

  std::string id;
  id.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      id.push_back('-');
    }
    id.push_back(kHex[bytes[i] >> 4]);
    id.push_back(kHex[bytes[i] & 0x0F]);
  }
  return id;
}

// Tokens come from the OS entropy source; they are bearer credentials.
std::string GenerateToken(std::size_t length) {
  static thread_local std::random_device      entropy;
  std::uniform_int_distribution<std::size_t> pick(0, sizeof(kTokenAlphabet) - 2);

  std::string token;
  token.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    token.push_back(kTokenAlphabet[pick(entropy)]);
  }
  return token;
}

bool IsValidToken(const std::string& token) {
  if (token.empty()) {
    return false;
  }
  for (char c : token) {
    const bool upper = c >= 'A' && c <= 'Z';
    const bool digit = c >= '0' && c <= '9';
    if (!upper && !digit) {
      return false;
    }
  }
  return true;
}

} // namespace vkyc::util
