#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace tierbridge::util {

/*
  UUID helpers

  Transfer, operation, warm and transcode ids are RFC4122 v4 UUIDs
  carried as canonical 36 character strings.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

} // namespace tierbridge::util
