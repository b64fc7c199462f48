#pragma once
#include <filesystem>
#include <map>
#include <string>

namespace gitwire {

struct ClientConfig {
  std::string ssh_command{"ssh"};
  bool thin_packs{true};
  std::map<std::string, std::string> remotes; // name -> URL
};

// Read .git/gitwire.conf under `git_dir` (defaults if missing)
ClientConfig load_config(const std::filesystem::path& git_dir);

// Overwrite .git/gitwire.conf with the given settings
void save_config(const std::filesystem::path& git_dir, const ClientConfig& cfg);

// URL for a configured remote name; anything else is returned unchanged.
std::string resolve_remote(const ClientConfig& cfg, const std::string& name_or_url);

} // namespace gitwire
