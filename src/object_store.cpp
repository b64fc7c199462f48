#include "gitwire/object_store.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/errors.hpp"
#include "gitwire/fs.hpp"
#include "gitwire/graph_walker.hpp"

#include <algorithm>
#include <fstream>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>

namespace gfs = gitwire::fs;

namespace gitwire {

namespace {

constexpr std::size_t kPackHeaderSize = 12;

// Trailer of a complete pack: "PACK", version 2 or 3, and a SHA-1 of
// everything before the trailer. nullopt for anything else.
auto verified_pack_checksum(const std::vector<std::uint8_t> &bytes) -> std::optional<oid> {
  if (bytes.size() < kPackHeaderSize + consts::kOidRawLen) {
    return std::nullopt;
  }
  if (!std::equal(bytes.begin(), bytes.begin() + 4, consts::kPackMagic.begin())) {
    return std::nullopt;
  }
  const std::uint32_t version = (std::uint32_t{bytes[4]} << 24U) |
                                (std::uint32_t{bytes[5]} << 16U) |
                                (std::uint32_t{bytes[6]} << 8U) | std::uint32_t{bytes[7]};
  if (version != 2 && version != 3) {
    return std::nullopt;
  }
  const std::size_t body = bytes.size() - consts::kOidRawLen;
  oid trailer{};
  std::copy(bytes.begin() + static_cast<std::ptrdiff_t>(body), bytes.end(), trailer.begin());
  if (sha1(std::span<const std::uint8_t>(bytes.data(), body)) != trailer) {
    return std::nullopt;
  }
  return trailer;
}

} // namespace

// Shared helpers

auto ObjectStore::read_tree(const oid &id) const -> Tree {
  const auto obj = read(id);
  if (obj.type != consts::kTypeTree) {
    throw GitError("object is not a tree: " + to_hex(id));
  }
  return Tree::parse(obj.data);
}

auto ObjectStore::iter_tree_contents(const oid &tree) const -> std::vector<TreeContent> {
  std::vector<TreeContent> out;
  const auto walk = [&](const auto &self, const oid &id, const std::string &prefix) -> void {
    for (const auto &e : read_tree(id).entries()) {
      const std::string path = prefix.empty() ? e.name : prefix + "/" + e.name;
      if ((e.mode & consts::kModeTypeMask) == consts::kModeTree) {
        self(self, e.id, path);
      } else {
        out.push_back(TreeContent{.path = path, .mode = e.mode, .id = e.id});
      }
    }
  };
  walk(walk, tree, std::string{});
  return out;
}

auto ObjectStore::determine_wants_all(const RefMap &refs) const -> std::vector<oid> {
  std::set<oid> wants;
  for (const auto &[name, id] : refs) {
    if (name.ends_with("^{}") || id == kZeroOid || contains(id)) {
      continue;
    }
    wants.insert(id);
  }
  return {wants.begin(), wants.end()};
}

auto ObjectStore::find_missing_objects(const std::vector<oid> &have,
                                       const std::vector<oid> &want) const
    -> std::vector<Object> {
  std::set<oid> seen;
  std::vector<Object> out;

  // Visit commits, their trees and blobs. Objects not present locally are
  // skipped (shallow or partial history).
  const auto visit = [&](const auto &self, const oid &id, bool collect) -> void {
    if (!seen.insert(id).second || !contains(id)) {
      return;
    }
    auto obj = read(id);
    if (obj.type == consts::kTypeCommit) {
      const auto info = parse_commit(obj.data);
      self(self, info.tree, collect);
      for (const auto &p : info.parents) {
        self(self, p, collect);
      }
    } else if (obj.type == consts::kTypeTree) {
      for (const auto &e : Tree::parse(obj.data).entries()) {
        if ((e.mode & consts::kModeTypeMask) != consts::kModeGitlink) {
          self(self, e.id, collect);
        }
      }
    }
    if (collect) {
      out.push_back(std::move(obj));
    }
  };

  for (const auto &h : have) {
    visit(visit, h, false);
  }
  for (const auto &w : want) {
    visit(visit, w, true);
  }
  return out;
}

auto ObjectStore::graph_walker(const std::vector<oid> &heads) const
    -> std::unique_ptr<GraphWalker> {
  return std::make_unique<ObjectStoreGraphWalker>(*this, heads);
}

// Loose objects

auto LooseObjectStore::path_for_oid(const oid &object_id) const -> std::filesystem::path {
  const std::string hex = to_hex(object_id);
  const std::filesystem::path dir =
      gitdir_ / consts::kObjectsDir / hex.substr(0, consts::kFanoutDirHexLen);
  return dir / hex.substr(consts::kFanoutDirHexLen);
}

auto LooseObjectStore::pack_dir() const -> std::filesystem::path {
  return gitdir_ / consts::kObjectsDir / consts::kPackDir;
}

auto LooseObjectStore::local_heads() const -> std::vector<oid> {
  std::set<oid> heads;
  for (const auto &[name, id] : read_loose_refs(gitdir_)) {
    heads.insert(id);
  }
  return {heads.begin(), heads.end()};
}

auto LooseObjectStore::contains(const oid &id) const -> bool {
  return gfs::exists(path_for_oid(id));
}

auto LooseObjectStore::read(const oid &id) const -> Object {
  const auto path = path_for_oid(id);
  if (!gfs::exists(path)) {
    throw GitError("object not found: " + to_hex(id));
  }
  auto store = gfs::z_decompress(gfs::read_file(path));

  auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(' '));
  if (it_space == store.end()) {
    throw GitError("object_store: invalid header in " + to_hex(id));
  }
  auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>('\0'));
  if (it_nul == store.end()) {
    throw GitError("object_store: invalid header in " + to_hex(id));
  }
  std::string type(store.begin(), it_space);
  std::size_t payload_off = (it_nul - store.begin()) + 1;
  return Object{.type = std::move(type), .data = {store.begin() + payload_off, store.end()}};
}

auto LooseObjectStore::write(std::string_view type, std::span<const std::uint8_t> payload)
    -> oid {
  const std::string hdr = object_header(type, payload.size());
  std::vector<std::uint8_t> store;
  store.reserve(hdr.size() + payload.size());
  store.insert(store.end(), hdr.begin(), hdr.end());
  store.insert(store.end(), payload.begin(), payload.end());

  const oid store_id = sha1(store);
  const auto path = path_for_oid(store_id);
  if (!gfs::exists(path)) {
    gfs::write_file_atomic(path, gfs::z_compress(store));
  }
  return store_id;
}

auto LooseObjectStore::add_pack() -> PackTarget {
  std::filesystem::create_directories(pack_dir());
  const auto tmp = pack_dir() / ("tmp_pack_" + std::to_string(std::random_device{}()));
  auto out = std::make_shared<std::ofstream>(tmp, std::ios::binary | std::ios::trunc);
  if (!*out) {
    throw std::runtime_error("open pack for write failed: " + tmp.string());
  }

  auto write = [out, tmp](std::string_view data) {
    out->write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!*out) {
      throw std::runtime_error("write pack failed: " + tmp.string());
    }
  };

  auto commit = [out, tmp, dir = pack_dir()]() {
    out->close();
    std::error_code ec;
    const auto size = std::filesystem::file_size(tmp, ec);
    if (ec || size == 0) {
      std::filesystem::remove(tmp, ec);
      return;
    }
    const auto bytes = gfs::read_file(tmp);
    const auto checksum = verified_pack_checksum(bytes);
    if (!checksum) {
      std::filesystem::remove(tmp, ec);
      throw GitError("received pack is truncated or corrupt (" + std::to_string(bytes.size()) +
                     " bytes)");
    }
    // The pack's own trailer names it.
    std::filesystem::rename(tmp, dir / ("pack-" + to_hex(*checksum) + ".pack"));
  };

  return PackTarget{.write = std::move(write), .commit = std::move(commit)};
}

// In-memory objects

auto MemoryObjectStore::contains(const oid &id) const -> bool { return objects_.contains(id); }

auto MemoryObjectStore::read(const oid &id) const -> Object {
  const auto it = objects_.find(id);
  if (it == objects_.end()) {
    throw GitError("object not found: " + to_hex(id));
  }
  return it->second;
}

auto MemoryObjectStore::write(std::string_view type, std::span<const std::uint8_t> payload)
    -> oid {
  Object obj{.type = std::string(type), .data = {payload.begin(), payload.end()}};
  const oid id = obj.id();
  objects_.try_emplace(id, std::move(obj));
  return id;
}

auto MemoryObjectStore::add_pack() -> PackTarget {
  auto buf = std::make_shared<std::string>();
  return PackTarget{
      .write = [buf](std::string_view data) { buf->append(data); },
      .commit =
          [this, buf]() {
            if (!buf->empty()) {
              packs_.push_back(std::move(*buf));
            }
          },
  };
}

} // namespace gitwire
