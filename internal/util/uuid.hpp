#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace freight::util {

/*
  UUID helpers

  Record ids are RFC4122 v4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Prefixed string id, e.g. "shp_3f2a...". Prefix is informational only.
std::string NewId(const std::string& prefix);

} // namespace freight::util
