#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace slideshow::util {

/*
  Random (version 4) UUIDs for naming staging areas, uploaded files and
  output artifacts, so concurrent and historical attempts never collide.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// canonical 8-4-4-4-12 lower-case form
std::string ToString(const UUID& id);

// 8 hex chars from a fresh UUID; disambiguates names created in the same millisecond
std::string ShortToken();

} // namespace slideshow::util
