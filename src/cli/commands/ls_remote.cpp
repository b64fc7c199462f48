#include "cli/command.hpp"
#include "cli/context.hpp"

#include "gitwire/hash.hpp"

#include <iostream>

namespace gitwire::cli {

// Works outside a worktree too; remote names then cannot be resolved.
int ls_remote(const Args &args) {
  if (args.size() != 1) {
    throw UsageError("");
  }
  const auto root = find_worktree_root();
  const auto cfg = root ? load_config(git_dir_of(*root)) : ClientConfig{};
  auto [client, path] = open_remote(cfg, args[0]);
  for (const auto &[name, id] : client->get_refs(path)) {
    std::cout << to_hex(id) << '\t' << name << "\n";
  }
  return 0;
}

} // namespace gitwire::cli
