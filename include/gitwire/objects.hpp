#pragma once
#include "gitwire/hash.hpp"

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitwire {

struct Object {
  std::string type;                  // "blob" | "tree" | "commit" | "tag"
  std::vector<std::uint8_t> data;    // payload bytes (no header)

  [[nodiscard]] auto id() const -> oid { return hash_object(type, data); }
};

struct TreeEntry {
  std::uint32_t mode; // e.g., gitwire::consts::kModeFile file, 040000 dir (octal)
  std::string name;   // filename (no '/')
  oid id;             // 20-byte raw SHA-1 of referenced object
};

/**
 * A directory listing. Entries are keyed by name; serialization emits them in
 * Git's canonical order, where a subtree "foo" sorts as "foo/".
 */
class Tree {
public:
  void add(std::string name, std::uint32_t mode, const oid &id);
  [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }

  // Entries in canonical order.
  [[nodiscard]] auto entries() const -> std::vector<TreeEntry>;

  [[nodiscard]] auto serialize() const -> std::vector<std::uint8_t>;
  static auto parse(std::span<const std::uint8_t> data) -> Tree;

  [[nodiscard]] auto to_object() const -> Object;
  [[nodiscard]] auto id() const -> oid;

private:
  std::map<std::string, TreeEntry> entries_;
};

struct CommitInfo {
  oid tree{};
  std::vector<oid> parents; // zero or more parents
  std::string author;       // full author line after "author "
  std::string committer;    // full committer line
  std::string message;      // raw message (may contain newlines)
};

// Parse a commit payload into headers + message.
auto parse_commit(std::span<const std::uint8_t> data) -> CommitInfo;

auto mode_to_ascii_octal(std::uint32_t mode) -> std::string;
auto ascii_octal_to_mode(std::string_view str) -> std::uint32_t;

} // namespace gitwire
