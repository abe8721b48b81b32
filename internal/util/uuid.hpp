#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace localrun::util {

/*
  UUID helpers

  Execution ids and temporary resource names use random RFC4122 v4 UUIDs.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

} // namespace localrun::util
