#pragma once
#include "gitwire/hash.hpp"
#include "gitwire/objects.hpp"

#include <cstdint>
#include <functional>
#include <span>
#include <string_view>
#include <vector>

namespace gitwire {

using ByteSink = std::function<void(std::span<const std::uint8_t>)>;

// Pack type code for an object type name ("commit" -> 1, ...).
auto pack_type_code(std::string_view type) -> std::uint8_t;

/**
 * Serialize `objects` as a version 2 pack without deltas:
 *   "PACK" | version | count | (type/size header, zlib data)* | SHA-1
 * Returns the trailing checksum.
 */
auto write_pack_objects(const ByteSink &sink, const std::vector<Object> &objects) -> oid;

} // namespace gitwire
