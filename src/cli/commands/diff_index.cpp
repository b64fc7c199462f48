#include "cli/command.hpp"
#include "cli/context.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/index.hpp"
#include "gitwire/object_store.hpp"
#include "gitwire/objects.hpp"

#include <algorithm>
#include <functional>
#include <iostream>
#include <string>

namespace gitwire::cli {

int diff_index(const Args &args) {
  if (args.size() != 1) {
    throw UsageError("");
  }
  oid tree{};
  if (!from_hex(args[0], tree)) {
    throw UsageError("bad tree id: " + args[0]);
  }

  const auto git_dir = git_dir_of(require_worktree_root());
  LooseObjectStore store{git_dir};
  const Index index{git_dir / consts::kIndexFile};

  auto changes = index.changes_from_tree(store, tree);
  const auto path_of = [](const TreeChange &c) { return c.new_path ? *c.new_path : *c.old_path; };
  std::ranges::sort(changes, {}, path_of);

  for (const auto &c : changes) {
    const char kind = !c.old_path ? 'A' : !c.new_path ? 'D' : 'M';
    std::cout << kind << '\t' << path_of(c) << "\n";
  }
  return 0;
}

} // namespace gitwire::cli
