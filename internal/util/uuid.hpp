#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace dispatcher::util {

/*
  UUID helpers

  Process ids are raw 16 byte RFC4122 v4 UUIDs. The persisted and wire
  form is the canonical 36 character text: 8-4-4-4-12 hex groups.
*/

using UUID = std::array<uint8_t, 16>;

inline constexpr std::size_t kCanonicalUuidLength = 36;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Strict parse of the canonical form; nullopt on any deviation.
std::optional<UUID> ParseCanonical(std::string_view str);

// Throws std::invalid_argument when str is not canonical.
UUID FromString(const std::string& str);

} // namespace dispatcher::util
