#include "gitwire/objects.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/errors.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace gitwire {

// Modes

auto mode_to_ascii_octal(std::uint32_t mode) -> std::string {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

auto ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      throw GitError("invalid octal mode: " + std::string(s));
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

// Trees

void Tree::add(std::string name, std::uint32_t mode, const oid &id) {
  if (name.empty() || name.find('/') != std::string::npos) {
    throw std::invalid_argument("invalid tree entry name: " + name);
  }
  auto key = name;
  entries_[key] = TreeEntry{.mode = mode, .name = std::move(name), .id = id};
}

auto Tree::entries() const -> std::vector<TreeEntry> {
  std::vector<TreeEntry> out;
  out.reserve(entries_.size());
  for (const auto &[name, e] : entries_) {
    out.push_back(e);
  }
  auto sort_key = [](const TreeEntry &e) {
    return (e.mode & consts::kModeTypeMask) == consts::kModeTree ? e.name + "/" : e.name;
  };
  std::ranges::sort(out, [&](const TreeEntry &a, const TreeEntry &b) {
    return sort_key(a) < sort_key(b);
  });
  return out;
}

auto Tree::serialize() const -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> data;
  for (const auto &e : entries()) {
    const std::string head = mode_to_ascii_octal(e.mode) + consts::kSpace + e.name + consts::kNul;
    data.insert(data.end(), head.begin(), head.end());
    data.insert(data.end(), e.id.begin(), e.id.end());
  }
  return data;
}

auto Tree::parse(std::span<const std::uint8_t> data) -> Tree {
  Tree tree;
  auto p = data.begin();
  const auto end = data.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw GitError("tree parse: expected space");
    }
    const std::uint32_t mode = ascii_octal_to_mode(std::string(p, q_space));

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw GitError("tree parse: expected NUL");
    }
    std::string name(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw GitError("tree parse: truncated oid");
    }

    oid id{};
    std::memcpy(id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    tree.add(std::move(name), mode, id);
  }
  return tree;
}

auto Tree::to_object() const -> Object {
  return Object{.type = std::string(consts::kTypeTree), .data = serialize()};
}

auto Tree::id() const -> oid { return hash_object(consts::kTypeTree, serialize()); }

// Commits

auto parse_commit(std::span<const std::uint8_t> data) -> CommitInfo {
  const std::string text(data.begin(), data.end());

  CommitInfo info{};
  std::size_t pos = 0;

  auto parse_id = [](std::string_view hex) {
    oid id{};
    if (!from_hex(hex.substr(0, consts::kOidHexLen), id)) {
      throw GitError("commit parse: bad object id");
    }
    return id;
  };

  for (;;) {
    const std::size_t nl = text.find('\n', pos);
    const std::string_view line = (nl == std::string::npos)
                                      ? std::string_view(text).substr(pos)
                                      : std::string_view(text).substr(pos, nl - pos);

    if (line.empty()) {
      if (nl != std::string::npos) {
        info.message = text.substr(nl + 1);
      }
      break;
    }

    if (line.starts_with("tree ")) {
      info.tree = parse_id(line.substr(5));
    } else if (line.starts_with("parent ")) {
      info.parents.push_back(parse_id(line.substr(7)));
    } else if (line.starts_with("author ")) {
      info.author = std::string(line.substr(7));
    } else if (line.starts_with("committer ")) {
      info.committer = std::string(line.substr(10));
    }

    if (nl == std::string::npos) break;
    pos = nl + 1;
  }

  return info;
}

} // namespace gitwire
