#include "cli/command.hpp"
#include "cli/context.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/index.hpp"
#include "gitwire/object_store.hpp"

#include <iostream>

namespace gitwire::cli {

int write_tree(const Args &args) {
  if (!args.empty()) {
    throw UsageError("");
  }
  const auto git_dir = git_dir_of(require_worktree_root());
  LooseObjectStore store{git_dir};
  const Index index{git_dir / consts::kIndexFile};
  std::cout << to_hex(index.commit(store)) << "\n";
  return 0;
}

} // namespace gitwire::cli
