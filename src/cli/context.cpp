#include "cli/context.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/errors.hpp"
#include "gitwire/transport.hpp"

#include <iostream>

namespace gitwire::cli {

std::optional<std::filesystem::path> find_worktree_root() {
  auto dir = std::filesystem::current_path();
  for (;;) {
    if (std::filesystem::is_directory(dir / consts::kGitDir)) {
      return dir;
    }
    if (!dir.has_parent_path() || dir.parent_path() == dir) {
      return std::nullopt;
    }
    dir = dir.parent_path();
  }
}

std::filesystem::path require_worktree_root() {
  auto root = find_worktree_root();
  if (!root) {
    throw NotGitRepository("not a git repository (or any parent up to /): " +
                           std::filesystem::current_path().string());
  }
  return *root;
}

std::filesystem::path git_dir_of(const std::filesystem::path &root) { return root / consts::kGitDir; }

std::pair<std::unique_ptr<GitClient>, std::string> open_remote(const ClientConfig &cfg,
                                                               const std::string &name_or_url) {
  TransportOptions opts;
  opts.thin_packs = cfg.thin_packs;
  opts.ssh_vendor = std::make_shared<SubprocessSshVendor>(cfg.ssh_command);
  return get_transport_and_path(resolve_remote(cfg, name_or_url), opts);
}

void print_progress(std::string_view data) {
  std::cerr.write(data.data(), static_cast<std::streamsize>(data.size()));
  std::cerr.flush();
}

} // namespace gitwire::cli
