#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st; // OpenSSL EVP_MD_CTX

namespace gitwire {

// Raw 20-byte SHA-1 object id (binary, not hex)
using oid = std::array<std::uint8_t, 20>;

// The all-zero id: "ref does not exist" on the wire.
inline constexpr oid kZeroOid{};

/**
 * Compute SHA-1 of arbitrary bytes.
 * NOTE: For Git object ids, you must hash the full
 *   "<type> <size>\\0" + data
 * buffer. Use object_header(...) to build the header.
 */
oid sha1(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline oid sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/**
 * Incremental SHA-1 over an EVP digest context. Used where data is hashed
 * while it streams (index files, pack trailers).
 */
class Sha1 {
public:
  Sha1();
  ~Sha1();

  Sha1(const Sha1 &) = delete;
  auto operator=(const Sha1 &) -> Sha1 & = delete;

  void update(std::span<const std::uint8_t> data);
  void update(std::string_view s) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()),
                                         s.size()));
  }

  // Digest of everything seen so far; the context stays usable.
  [[nodiscard]] auto digest() const -> oid;

private:
  evp_md_ctx_st *ctx_{nullptr};
};

/** Convert binary oid to 40-char lowercase hex. */
std::string to_hex(const oid &id);

/**
 * Parse 40-char hex into binary oid.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, oid &out);

/**
 * Build the Git object header used for hashing:
 *   "<type> <size>\\0"
 */
inline std::string object_header(std::string_view type, std::size_t size) {
  std::string s;
  s.reserve(type.size() + 1 + 20 + 1); // rough reserve
  s.append(type);
  s.push_back(' ');
  s.append(std::to_string(size));
  s.push_back('\0');
  return s;
}

// Object id of a payload of the given type.
oid hash_object(std::string_view type, std::span<const std::uint8_t> payload);

} // namespace gitwire
