#include "gitwire/fs.hpp"
#include "gitwire/hash.hpp"
#include "gitwire/pack.hpp"

#include "test_util.hpp"

#include <algorithm>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

using gitwire::Object;

namespace {

auto blob(std::string_view content) -> Object {
  return Object{.type = "blob", .data = {content.begin(), content.end()}};
}

auto be32_at(const std::vector<std::uint8_t> &buf, std::size_t off) -> std::uint32_t {
  return (std::uint32_t{buf[off]} << 24U) | (std::uint32_t{buf[off + 1]} << 16U) |
         (std::uint32_t{buf[off + 2]} << 8U) | std::uint32_t{buf[off + 3]};
}

auto write_pack(const std::vector<Object> &objects, gitwire::oid &trailer)
    -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out;
  trailer = gitwire::write_pack_objects(
      [&out](std::span<const std::uint8_t> d) { out.insert(out.end(), d.begin(), d.end()); },
      objects);
  return out;
}

} // namespace

int main() {
  try {
    // Header, entry header, compressed body, trailer
    {
      gitwire::oid trailer{};
      const auto pack = write_pack({blob("hello"), blob(std::string(300, 'x'))}, trailer);

      check(pack.size() > 12 + 20, "pack size");
      check(std::string(pack.begin(), pack.begin() + 4) == "PACK", "signature");
      check(be32_at(pack, 4) == 2, "version");
      check(be32_at(pack, 8) == 2, "object count");

      const std::span<const std::uint8_t> body(pack.data(), pack.size() - 20);
      check(gitwire::sha1(body) == trailer, "trailer is SHA-1 of the rest");
      check(std::equal(trailer.begin(), trailer.end(), pack.end() - 20), "trailer written last");

      // blob (3), size 5: one byte 0b0011'0101
      check(pack[12] == 0x35, "small entry header");

      // Entry data is the payload's zlib stream.
      const auto z = gitwire::fs::z_compress(blob("hello").data);
      check(std::equal(z.begin(), z.end(), pack.begin() + 13), "first entry data");
      const auto inflated =
          gitwire::fs::z_decompress(std::span<const std::uint8_t>(pack.data() + 13, z.size()));
      check(std::string(inflated.begin(), inflated.end()) == "hello", "inflates to payload");

      // blob, size 300 = 0x12c: low nibble 0xc with the more bit, then 0x12
      const std::size_t second = 13 + z.size();
      check(pack[second] == 0xBC && pack[second + 1] == 0x12, "multi-byte entry header");
    }

    // Type codes
    check(gitwire::pack_type_code("commit") == 1, "commit code");
    check(gitwire::pack_type_code("tree") == 2, "tree code");
    check(gitwire::pack_type_code("blob") == 3, "blob code");
    check(gitwire::pack_type_code("tag") == 4, "tag code");
    check_throws<std::invalid_argument>([] { (void)gitwire::pack_type_code("ofs-delta"); },
                                        "unknown type");
    check_throws<std::invalid_argument>(
        [] {
          gitwire::oid ignored{};
          (void)write_pack({Object{.type = "bogus", .data = {}}}, ignored);
        },
        "unknown type while writing");

    // No objects: header and trailer only
    {
      gitwire::oid trailer{};
      const auto pack = write_pack({}, trailer);
      check(pack.size() == 12 + 20, "empty pack size");
      check(be32_at(pack, 8) == 0, "zero count");
      check(gitwire::sha1(std::span<const std::uint8_t>(pack.data(), 12)) == trailer,
            "empty pack trailer");
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
