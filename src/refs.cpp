#include "gitwire/refs.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/errors.hpp"
#include "gitwire/fs.hpp"

#include <string>
#include <string_view>

namespace gitwire {

namespace {

bool valid_ref_char(char c) {
  const auto u = static_cast<unsigned char>(c);
  if (u < 0x20 || u == 0x7f) {
    return false;
  }
  switch (c) {
  case ' ':
  case '~':
  case '^':
  case ':':
  case '?':
  case '*':
  case '[':
  case '\\':
    return false;
  default:
    return true;
  }
}

bool valid_ref_component(std::string_view comp) {
  return !comp.empty() && !comp.starts_with('.') && !comp.ends_with(".lock");
}

std::filesystem::path ref_path(const std::filesystem::path &git_dir, const std::string &refname) {
  if (!is_valid_ref_name(refname)) {
    throw GitError("invalid ref name: " + refname);
  }
  return git_dir / refname;
}

} // namespace

bool is_valid_ref_name(std::string_view name) {
  if (name.empty() || name == "@" || name.ends_with('.')) {
    return false;
  }
  if (name.find("..") != std::string_view::npos || name.find("@{") != std::string_view::npos) {
    return false;
  }
  for (const char c : name) {
    if (!valid_ref_char(c)) {
      return false;
    }
  }
  // leading, trailing or doubled '/' shows up as an empty component
  while (true) {
    const auto slash = name.find('/');
    if (!valid_ref_component(name.substr(0, slash))) {
      return false;
    }
    if (slash == std::string_view::npos) {
      return true;
    }
    name.remove_prefix(slash + 1);
  }
}

std::string heads_ref(std::string_view branch) {
  return std::string("refs/heads/") + std::string(branch);
}

std::optional<oid> read_ref(const std::filesystem::path &git_dir, const std::string &refname) {
  const auto p = ref_path(git_dir, refname);
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  auto bytes = fs::read_file(p);
  std::string s(bytes.begin(), bytes.end());
  // strip trailing whitespace/newlines
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
    s.pop_back();
  oid id{};
  if (!from_hex(s, id)) {
    return std::nullopt;
  }
  return id;
}

void update_ref(const std::filesystem::path &git_dir, const std::string &refname, const oid &id) {
  fs::write_file_atomic(ref_path(git_dir, refname), to_hex(id) + "\n");
}

RefMap read_loose_refs(const std::filesystem::path &git_dir) {
  RefMap refs;
  const auto root = git_dir / consts::kRefsDir;
  if (!fs::exists(root)) {
    return refs;
  }
  for (std::filesystem::recursive_directory_iterator it(root), end; it != end; ++it) {
    if (!it->is_regular_file()) {
      continue;
    }
    const std::string name = std::filesystem::relative(it->path(), git_dir).generic_string();
    if (!is_valid_ref_name(name)) {
      continue; // lock files and other leftovers
    }
    if (auto id = read_ref(git_dir, name)) {
      refs[name] = *id;
    }
  }
  return refs;
}

} // namespace gitwire
