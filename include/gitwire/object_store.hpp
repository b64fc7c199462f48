#pragma once
#include "gitwire/hash.hpp"
#include "gitwire/objects.hpp"
#include "gitwire/refs.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitwire {

class GraphWalker;

// One entry of a flattened tree: "dir/file", mode, id.
struct TreeContent {
  std::string path;
  std::uint32_t mode;
  oid id;
};

// Destination for an incoming pack stream. commit() finishes the pack; it must
// be called exactly once, whether or not the transfer succeeded.
struct PackTarget {
  std::function<void(std::string_view)> write;
  std::function<void()> commit;
};

class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  [[nodiscard]] virtual auto contains(const oid &id) const -> bool = 0;

  // Throws GitError if the object is missing.
  [[nodiscard]] virtual auto read(const oid &id) const -> Object = 0;

  // Store an object with given type/payload. Returns its id.
  virtual auto write(std::string_view type, std::span<const std::uint8_t> payload) -> oid = 0;

  virtual auto add_pack() -> PackTarget = 0;

  // Tips of local history, offered as haves when fetching into this store.
  [[nodiscard]] virtual auto local_heads() const -> std::vector<oid> { return {}; }

  auto add_object(const Object &obj) -> oid { return write(obj.type, obj.data); }
  auto add_object(const Tree &tree) -> oid { return add_object(tree.to_object()); }

  [[nodiscard]] auto read_tree(const oid &id) const -> Tree;

  // Every non-tree entry below `tree`, with paths relative to it.
  [[nodiscard]] auto iter_tree_contents(const oid &tree) const -> std::vector<TreeContent>;

  // Ids of advertised refs we do not have yet (peeled "^{}" entries skipped).
  [[nodiscard]] auto determine_wants_all(const RefMap &refs) const -> std::vector<oid>;

  // Objects reachable from `want` but not from `have`, for building a pack.
  [[nodiscard]] auto find_missing_objects(const std::vector<oid> &have,
                                          const std::vector<oid> &want) const
      -> std::vector<Object>;

  // Walker offering `heads` and their ancestors as haves.
  [[nodiscard]] auto graph_walker(const std::vector<oid> &heads) const
      -> std::unique_ptr<GraphWalker>;
};

/**
 * Git's loose object layout: zlib-compressed "<type> <size>\0<payload>" at
 * objects/aa/bbbb... under the git directory. Received packs are stored
 * verbatim as objects/pack/pack-<checksum>.pack.
 */
class LooseObjectStore : public ObjectStore {
public:
  explicit LooseObjectStore(std::filesystem::path gitdir)
    : gitdir_(std::move(gitdir)) {}

  [[nodiscard]] auto contains(const oid &id) const -> bool override;
  [[nodiscard]] auto read(const oid &id) const -> Object override;
  auto write(std::string_view type, std::span<const std::uint8_t> payload) -> oid override;
  auto add_pack() -> PackTarget override;
  [[nodiscard]] auto local_heads() const -> std::vector<oid> override;

  // Get filesystem path for a binary oid.
  [[nodiscard]] auto path_for_oid(const oid &object_id) const -> std::filesystem::path;
  [[nodiscard]] auto pack_dir() const -> std::filesystem::path;

private:
  std::filesystem::path gitdir_;
};

class MemoryObjectStore : public ObjectStore {
public:
  [[nodiscard]] auto contains(const oid &id) const -> bool override;
  [[nodiscard]] auto read(const oid &id) const -> Object override;
  auto write(std::string_view type, std::span<const std::uint8_t> payload) -> oid override;
  auto add_pack() -> PackTarget override;

  [[nodiscard]] auto size() const -> std::size_t { return objects_.size(); }
  // Completed, non-empty packs in arrival order.
  [[nodiscard]] auto packs() const -> const std::vector<std::string> & { return packs_; }

private:
  std::map<oid, Object> objects_;
  std::vector<std::string> packs_;
};

} // namespace gitwire
