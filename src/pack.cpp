#include "gitwire/pack.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/fs.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace gitwire {

auto pack_type_code(std::string_view type) -> std::uint8_t {
  if (type == consts::kTypeCommit) return 1;
  if (type == consts::kTypeTree) return 2;
  if (type == consts::kTypeBlob) return 3;
  if (type == consts::kTypeTag) return 4;
  throw std::invalid_argument("unknown object type: " + std::string(type));
}

namespace {

void put_be32(std::vector<std::uint8_t> &out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 24U));
  out.push_back(static_cast<std::uint8_t>(v >> 16U));
  out.push_back(static_cast<std::uint8_t>(v >> 8U));
  out.push_back(static_cast<std::uint8_t>(v));
}

// 3-bit type and size, 4 bits in the first byte then 7 per byte, MSB = more.
auto pack_entry_header(std::uint8_t type, std::size_t size) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out;
  auto byte = static_cast<std::uint8_t>((type << 4U) | (size & 0x0fU));
  size >>= 4U;
  while (size != 0) {
    out.push_back(static_cast<std::uint8_t>(byte | 0x80U));
    byte = static_cast<std::uint8_t>(size & 0x7fU);
    size >>= 7U;
  }
  out.push_back(byte);
  return out;
}

} // namespace

auto write_pack_objects(const ByteSink &sink, const std::vector<Object> &objects) -> oid {
  Sha1 checksum;
  const auto emit = [&](std::span<const std::uint8_t> data) {
    checksum.update(data);
    sink(data);
  };

  std::vector<std::uint8_t> header{'P', 'A', 'C', 'K'};
  put_be32(header, 2);
  put_be32(header, static_cast<std::uint32_t>(objects.size()));
  emit(header);

  for (const auto &obj : objects) {
    emit(pack_entry_header(pack_type_code(obj.type), obj.data.size()));
    emit(fs::z_compress(obj.data));
  }

  const oid digest = checksum.digest();
  sink(digest);
  return digest;
}

} // namespace gitwire
