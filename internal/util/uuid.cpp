#include "uuid.hpp"

#include <stdexcept>

namespace dispatcher::util {

namespace {

constexpr char kHex[] = "0123456789abcdef";

bool IsDashPosition(std::size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::string out;
  out.reserve(kCanonicalUuidLength);

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[id[i] >> 4]);
    out.push_back(kHex[id[i] & 0x0F]);
  }
  return out;
}

std::optional<UUID> ParseCanonical(std::string_view str) {
  if (str.size() != kCanonicalUuidLength) return std::nullopt;

  UUID        id{};
  std::size_t byte = 0;
  for (std::size_t i = 0; i < str.size();) {
    if (IsDashPosition(i)) {
      if (str[i] != '-') return std::nullopt;
      ++i;
      continue;
    }

    const int hi = HexNibble(str[i]);
    const int lo = HexNibble(str[i + 1]);
    if (hi < 0 || lo < 0 || IsDashPosition(i + 1)) return std::nullopt;

    id[byte++] = static_cast<uint8_t>((hi << 4) | lo);
    i += 2;
  }

  if (byte != id.size()) return std::nullopt;
  return id;
}

UUID FromString(const std::string& str) {
  auto id = ParseCanonical(str);
  if (!id)
    throw std::invalid_argument("invalid UUID string: '" + str + "'");
  return *id;
}

} // namespace dispatcher::util
