#include "cli/command.hpp"
#include "cli/context.hpp"

#include "gitwire/errors.hpp"
#include "gitwire/object_store.hpp"
#include "gitwire/refs.hpp"

#include <iostream>
#include <string>

namespace gitwire::cli {

int send_pack(const Args &args) {
  if (args.size() < 2) {
    throw UsageError("");
  }
  const auto git_dir = git_dir_of(require_worktree_root());
  const auto cfg = load_config(git_dir);

  RefMap updates;
  for (auto it = args.begin() + 1; it != args.end(); ++it) {
    const std::string ref = it->starts_with("refs/") ? *it : heads_ref(*it);
    const auto id = read_ref(git_dir, ref);
    if (!id) {
      throw GitError("no such ref: " + ref);
    }
    updates[ref] = *id;
  }

  auto [client, path] = open_remote(cfg, args[0]);
  LooseObjectStore store{git_dir};

  const auto new_refs = [&updates](const RefMap &old_refs) {
    RefMap next = old_refs;
    for (const auto &[ref, id] : updates) {
      next[ref] = id;
    }
    return std::optional<RefMap>(std::move(next));
  };
  const auto pack_contents = [&store](const std::vector<oid> &have, const std::vector<oid> &want) {
    return store.find_missing_objects(have, want);
  };

  try {
    client->send_pack(path, new_refs, pack_contents, print_progress);
  } catch (const UpdateRefsError &e) {
    // one line per refused ref; the rest were updated
    for (const auto &[ref, reason] : e.ref_status()) {
      std::cerr << ref << " rejected: " << reason << "\n";
    }
    throw;
  }
  for (const auto &[ref, id] : updates) {
    std::cout << "ok " << ref << " " << to_hex(id) << "\n";
  }
  return 0;
}

} // namespace gitwire::cli
