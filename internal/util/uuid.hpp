#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace storykb::util {

/*
  UUID helpers

  Entity identifiers, transaction ids and staging tokens are raw 16 byte
  RFC4122 v4 UUIDs rendered in canonical 8-4-4-4-12 form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Generates and renders in one step.
std::string NewId();

bool IsCanonicalUUID(const std::string& str);

} // namespace storykb::util
