#include "gitwire/hash.hpp"
#include "gitwire/consts.hpp"

#include <cstdint>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gitwire {

oid sha1(std::span<const std::uint8_t> data) {
  Sha1 h;
  h.update(data);
  return h.digest();
}

Sha1::Sha1() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_sha1(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
  }
}

Sha1::~Sha1() { EVP_MD_CTX_free(ctx_); }

void Sha1::update(std::span<const std::uint8_t> data) {
  if (!data.empty() && EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

auto Sha1::digest() const -> oid {
  // Finalize a copy so callers can keep feeding the running hash.
  EVP_MD_CTX *copy = EVP_MD_CTX_new();
  if (!copy) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_MD_CTX_copy_ex(copy, ctx_) != 1) {
    EVP_MD_CTX_free(copy);
    throw std::runtime_error("EVP_MD_CTX_copy_ex failed");
  }

  oid out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(copy, out.data(), &len) != 1) {
    EVP_MD_CTX_free(copy);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  EVP_MD_CTX_free(copy);

  if (len != out.size()) {
    throw std::runtime_error("SHA-1 produced unexpected length");
  }
  return out;
}

oid hash_object(std::string_view type, std::span<const std::uint8_t> payload) {
  Sha1 h;
  h.update(object_header(type, payload.size()));
  h.update(payload);
  return h.digest();
}

std::string to_hex(const oid &id) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(gitwire::consts::kOidHexLen);
  for (std::size_t i = 0; i < gitwire::consts::kOidRawLen; ++i) {
    unsigned b = id[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

bool from_hex(std::string_view hex, oid &out) {
  if (hex.size() != gitwire::consts::kOidHexLen) {
    return false;
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
      return 10 + (c - 'A');
    }
    return -1;
  };
  for (int i = 0; i < 20; ++i) {
    int hi = nibble(hex[2 * i]);
    int lo = nibble(hex[(2 * i) + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

} // namespace gitwire
