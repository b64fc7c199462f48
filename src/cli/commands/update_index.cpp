#include "cli/command.hpp"
#include "cli/context.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/errors.hpp"
#include "gitwire/fs.hpp"
#include "gitwire/index.hpp"
#include "gitwire/object_store.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace gitwire::cli {

namespace {

namespace stdfs = std::filesystem;

// Blob payload for a file: its bytes, or the link target for a symlink.
auto blob_payload(const stdfs::path &abs) -> std::vector<std::uint8_t> {
  if (stdfs::is_symlink(abs)) {
    const std::string target = stdfs::read_symlink(abs).string();
    return {target.begin(), target.end()};
  }
  return fs::read_file(abs);
}

} // namespace

int update_index(const Args &args) {
  if (args.empty()) {
    throw UsageError("");
  }
  const stdfs::path root = require_worktree_root();
  const stdfs::path git_dir = git_dir_of(root);
  LooseObjectStore store{git_dir};
  Index index{git_dir / consts::kIndexFile};

  for (const auto &arg : args) {
    const stdfs::path abs = stdfs::absolute(arg).lexically_normal();
    const std::string rel = abs.lexically_relative(root).generic_string();
    if (rel.empty() || rel.starts_with("..")) {
      throw GitError("outside repository: " + arg);
    }

    const auto st = stdfs::symlink_status(abs);
    if (!stdfs::exists(st)) {
      if (!index.contains(rel)) {
        throw GitError("no such file: " + rel);
      }
      index.erase(rel);
      std::cout << "removed: " << rel << "\n";
      continue;
    }
    if (!stdfs::is_regular_file(st) && !stdfs::is_symlink(st)) {
      std::cerr << "skipping non-regular file: " << rel << "\n";
      continue;
    }

    const auto sha = store.write(consts::kTypeBlob, blob_payload(abs));
    index.set(rel, index_entry_from_stat(abs, sha));
    std::cout << "staged: " << rel << "\n";
  }
  index.write();
  return 0;
}

} // namespace gitwire::cli
