#include "uuid.hpp"

#include <random>

#include "errors.hpp"

namespace chronicle::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (size_t i = 0; i < id.size(); i += 8) {
    const uint64_t bits = rng();
    for (size_t j = 0; j < 8; ++j) id[i + j] = static_cast<uint8_t>(bits >> (j * 8));
  }

  id[6] = (id[6] & 0x0F) | 0x40; // version 4
  id[8] = (id[8] & 0x3F) | 0x80; // RFC4122 variant

  return id;
}

std::string ToString(const UUID& id) {
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHexDigits[id[i] >> 4]);
    out.push_back(kHexDigits[id[i] & 0x0F]);
  }
  return out;
}

UUID FromString(std::string_view text) {
  UUID   id{};
  size_t nibble = 0;

  for (char c : text) {
    if (c == '-') continue;
    const int v = HexValue(c);
    if (v < 0 || nibble >= 32) throw InvalidArgument(std::string(text), "not a uuid");
    id[nibble / 2] = static_cast<uint8_t>((nibble % 2 == 0) ? (v << 4) : (id[nibble / 2] | v));
    ++nibble;
  }

  if (nibble != 32) throw InvalidArgument(std::string(text), "not a uuid");
  return id;
}

std::string NewId() {
  return ToString(GenerateUUID());
}

std::string NewVersionToken() {
  return ToString(GenerateUUID());
}

} // namespace chronicle::util
