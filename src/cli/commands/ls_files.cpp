#include "cli/command.hpp"
#include "cli/context.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/index.hpp"
#include "gitwire/objects.hpp"

#include <iomanip>
#include <iostream>
#include <string>

namespace gitwire::cli {

int ls_files(const Args &args) {
  bool stage = false;
  for (const auto &arg : args) {
    if (arg != "-s" && arg != "--stage") {
      throw UsageError("unknown option: " + arg);
    }
    stage = true;
  }

  const auto git_dir = git_dir_of(require_worktree_root());
  const Index index{git_dir / consts::kIndexFile};
  for (const auto &[path, e] : index.entries()) {
    if (stage) {
      // stage number is bits 12-13 of the flags
      std::cout << std::setw(6) << std::setfill('0') << mode_to_ascii_octal(e.mode) << ' '
                << to_hex(e.sha) << ' ' << ((e.flags >> 12U) & 0x3U) << '\t';
    }
    std::cout << path << "\n";
  }
  return 0;
}

} // namespace gitwire::cli
