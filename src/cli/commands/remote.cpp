#include "cli/command.hpp"
#include "cli/context.hpp"

#include "gitwire/errors.hpp"
#include "gitwire/refs.hpp"

#include <iostream>
#include <string>

namespace gitwire::cli {

int remote(const Args &args) {
  const auto git_dir = git_dir_of(require_worktree_root());
  auto cfg = load_config(git_dir);

  if (args.empty()) {
    for (const auto &[name, url] : cfg.remotes) {
      std::cout << name << '\t' << url << "\n";
    }
    return 0;
  }

  const std::string &action = args[0];
  if (action == "add" && args.size() == 3) {
    const std::string &name = args[1];
    // tracking refs live under refs/remotes/<name>/
    if (name.find('/') != std::string::npos || !is_valid_ref_name("refs/remotes/" + name)) {
      throw GitError("invalid remote name: " + name);
    }
    if (!cfg.remotes.try_emplace(name, args[2]).second) {
      throw GitError("remote " + name + " already exists");
    }
  } else if (action == "remove" && args.size() == 2) {
    if (cfg.remotes.erase(args[1]) == 0) {
      throw GitError("no such remote: " + args[1]);
    }
  } else {
    throw UsageError("");
  }
  save_config(git_dir, cfg);
  return 0;
}

} // namespace gitwire::cli
