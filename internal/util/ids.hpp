#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace vera::util {

/*
  ID helpers

  Request correlation ids are RFC4122 version 4 UUIDs. Resource ids follow
  the provider's "<prefix>-<hex>" form; the hex suffix is random, its length
  is chosen per resource type.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Fresh request id, e.g. "4f0c9a4e-5d1b-4c6f-9a43-2b2f4c0f5e11".
std::string NewRequestId();

// `length` lowercase hex digits from a per-thread generator.
std::string RandomHex(std::size_t length);

// "<prefix>-<hex>" with a random suffix of `suffix_length` digits. Only
// non-resource sub-identifiers (reservations, associations) are minted
// directly; resource ids come from the store.
std::string MakeId(std::string_view prefix, std::size_t suffix_length);

} // namespace vera::util
