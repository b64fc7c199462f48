#pragma once
#include "gitwire/client.hpp"
#include "gitwire/config.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace gitwire::cli {

// Nearest enclosing directory holding .git, starting at the current directory.
std::optional<std::filesystem::path> find_worktree_root();

// Same, but throws NotGitRepository when there is none.
std::filesystem::path require_worktree_root();

std::filesystem::path git_dir_of(const std::filesystem::path& root);

// Client for a URL or a remote name from the config.
std::pair<std::unique_ptr<GitClient>, std::string> open_remote(const ClientConfig& cfg,
                                                               const std::string& name_or_url);

// Remote progress goes straight to stderr.
void print_progress(std::string_view data);

} // namespace gitwire::cli
