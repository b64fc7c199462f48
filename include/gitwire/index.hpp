#pragma once
#include "gitwire/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <streambuf>
#include <string>
#include <string_view>
#include <vector>

namespace gitwire {

class ObjectStore;

struct CacheTime {
  std::uint32_t sec{0};
  std::uint32_t nsec{0};

  auto operator==(const CacheTime &) const -> bool = default;
};

/**
 * One staged file. `flags` holds only the high 4 bits (assume-valid, extended,
 * stage); the name length is recomputed from the path on write.
 */
struct IndexEntry {
  CacheTime ctime;
  CacheTime mtime;
  std::uint32_t dev{0};
  std::uint32_t ino{0};
  std::uint32_t mode{0};
  std::uint32_t uid{0};
  std::uint32_t gid{0};
  std::uint32_t size{0};
  oid sha{};
  std::uint16_t flags{0};

  auto operator==(const IndexEntry &) const -> bool = default;
};

struct NamedIndexEntry {
  std::string path;
  IndexEntry entry;
};

using IndexMap = std::map<std::string, IndexEntry>;

// Input for commit_tree: path, blob id, tree mode.
struct BlobEntry {
  std::string path;
  oid sha;
  std::uint32_t mode;
};

// A difference between a tree and the index. An absent side is nullopt.
struct TreeChange {
  std::optional<std::string> old_path, new_path;
  std::optional<std::uint32_t> old_mode, new_mode;
  std::optional<oid> old_sha, new_sha;
};

/**
 * Stream buffer adapters that SHA-1 every byte passing through them. The
 * index file's trailer is the digest of all bytes before it.
 */
class Sha1ReadBuf : public std::streambuf {
public:
  explicit Sha1ReadBuf(std::streambuf *src) : src_(src) {}

  [[nodiscard]] auto digest() const -> oid { return sha_.digest(); }
  [[nodiscard]] auto consumed() const -> std::uint64_t { return consumed_; }

protected:
  auto underflow() -> int_type override;
  auto uflow() -> int_type override;
  auto xsgetn(char *s, std::streamsize n) -> std::streamsize override;

private:
  std::streambuf *src_;
  Sha1 sha_;
  std::uint64_t consumed_{0};
};

class Sha1WriteBuf : public std::streambuf {
public:
  explicit Sha1WriteBuf(std::streambuf *dst) : dst_(dst) {}

  [[nodiscard]] auto digest() const -> oid { return sha_.digest(); }

protected:
  auto overflow(int_type c) -> int_type override;
  auto xsputn(const char *s, std::streamsize n) -> std::streamsize override;
  auto sync() -> int override { return dst_->pubsync(); }

private:
  std::streambuf *dst_;
  Sha1 sha_;
};

// Decode header and entries. Throws IndexError on bad magic, version or truncation.
auto read_index(std::istream &in) -> std::vector<NamedIndexEntry>;
auto read_index_dict(std::istream &in) -> IndexMap;

// Encode header (version 2) and entries in the given order. No checksum.
void write_index(std::ostream &out, const std::vector<NamedIndexEntry> &entries);
void write_index_dict(std::ostream &out, const IndexMap &entries);

// Mode as it may appear in a tree object.
auto cleanup_mode(std::uint32_t mode) -> std::uint32_t;

// Entry for a file on disk from lstat(2), with the given blob id.
auto index_entry_from_stat(const std::filesystem::path &file, const oid &sha) -> IndexEntry;

/**
 * The staging area bound to one index file. Reads the file on construction;
 * changes stay in memory until write().
 */
class Index {
public:
  explicit Index(std::filesystem::path filename);

  // Replace in-memory contents with the file's. No-op if the file is missing.
  void read();
  // Write all entries sorted by path, atomically replacing the file.
  void write() const;

  [[nodiscard]] auto path() const -> const std::filesystem::path & { return filename_; }
  [[nodiscard]] auto size() const -> std::size_t { return byname_.size(); }
  [[nodiscard]] auto contains(const std::string &name) const -> bool {
    return byname_.contains(name);
  }
  // Throws std::out_of_range for unknown paths.
  [[nodiscard]] auto get(const std::string &name) const -> const IndexEntry &;
  void set(const std::string &name, const IndexEntry &entry) { byname_[name] = entry; }
  void erase(const std::string &name);
  void clear() { byname_.clear(); }
  void update(const IndexMap &entries);
  [[nodiscard]] auto entries() const -> const IndexMap & { return byname_; }

  [[nodiscard]] auto get_sha1(const std::string &name) const -> oid { return get(name).sha; }
  [[nodiscard]] auto get_mode(const std::string &name) const -> std::uint32_t {
    return get(name).mode;
  }

  // (path, sha, cleaned mode) for commit_tree.
  [[nodiscard]] auto iterblobs() const -> std::vector<BlobEntry>;

  // Changes needed to turn `tree` into this index.
  [[nodiscard]] auto changes_from_tree(const ObjectStore &store, const oid &tree,
                                       bool want_unchanged = false) const
      -> std::vector<TreeChange>;

  // Store the index as a tree hierarchy; returns the root tree id.
  auto commit(ObjectStore &store) const -> oid;

private:
  std::filesystem::path filename_;
  IndexMap byname_;
};

} // namespace gitwire
