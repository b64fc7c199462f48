#include "gitwire/config.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/errors.hpp"
#include "gitwire/fs.hpp"

#include <sstream>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

bool parse_bool(const std::string &key, const std::string &value) {
  if (value == "true" || value == "yes" || value == "1")
    return true;
  if (value == "false" || value == "no" || value == "0")
    return false;
  throw gitwire::GitError("config: " + key + ": expected true or false, got '" + value + "'");
}

} // namespace

namespace gitwire {

static std::filesystem::path cfg_path(const std::filesystem::path &git_dir) {
  return git_dir / consts::kConfigFile;
}

auto load_config(const std::filesystem::path &git_dir) -> ClientConfig {
  ClientConfig out{};
  const auto path = cfg_path(git_dir);
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  constexpr std::string_view k_remote = "remote.";

  std::string line;
  while (std::getline(iss, line)) {
    const std::string entry = trim(line);
    if (entry.empty() || entry[0] == '#')
      continue; // allow comments
    const auto colon = entry.find(':');
    if (colon == std::string::npos)
      throw GitError("config: malformed line '" + entry + "' in " + path.string());

    const std::string key = trim(std::string_view(entry).substr(0, colon));
    const std::string value = trim(std::string_view(entry).substr(colon + 1));
    if (key == "ssh-command") {
      out.ssh_command = value;
    } else if (key == "thin-pack") {
      out.thin_packs = parse_bool(key, value);
    } else if (key.starts_with(k_remote) && key.size() > k_remote.size()) {
      out.remotes[key.substr(k_remote.size())] = value;
    }
    // unknown keys are left for other tools
  }
  return out;
}

void save_config(const std::filesystem::path &git_dir, const ClientConfig &cfg) {
  std::ostringstream os;
  os << "ssh-command: " << cfg.ssh_command << '\n'
     << "thin-pack: " << (cfg.thin_packs ? "true" : "false") << '\n';
  for (const auto &[name, url] : cfg.remotes) {
    os << "remote." << name << ": " << url << '\n';
  }
  fs::write_file_atomic(cfg_path(git_dir), os.str());
}

std::string resolve_remote(const ClientConfig &cfg, const std::string &name_or_url) {
  const auto it = cfg.remotes.find(name_or_url);
  return it == cfg.remotes.end() ? name_or_url : it->second;
}

} // namespace gitwire
