#include "gitwire/config.hpp"
#include "gitwire/errors.hpp"
#include "gitwire/fs.hpp"

#include "test_util.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace {

void write_conf(const std::filesystem::path &gitdir, std::string_view text) {
  gitwire::fs::write_file_atomic(gitdir / "gitwire.conf", text);
}

} // namespace

int main() {
  const auto gitdir = temp_dir("config");
  try {
    // Defaults when nothing is configured
    {
      const auto cfg = gitwire::load_config(gitdir);
      check(cfg.ssh_command == "ssh", "default ssh command");
      check(cfg.thin_packs, "thin packs on by default");
      check(cfg.remotes.empty(), "no remotes");
    }

    // Round trip
    {
      gitwire::ClientConfig cfg;
      cfg.ssh_command = "ssh -i /keys/deploy";
      cfg.thin_packs = false;
      cfg.remotes["origin"] = "git://example.com:9418/project.git";
      cfg.remotes["backup"] = "git@backup.example.com:project.git";
      gitwire::save_config(gitdir, cfg);

      const auto back = gitwire::load_config(gitdir);
      check(back.ssh_command == "ssh -i /keys/deploy", "ssh command kept");
      check(!back.thin_packs, "thin-pack false kept");
      check(back.remotes == cfg.remotes, "remotes kept, urls with colons intact");
    }

    // Comments, blank lines, padding and unknown keys
    {
      write_conf(gitdir, "# client settings\n"
                         "\n"
                         "  thin-pack :  no \r\n"
                         "color: auto\n"
                         "remote.up: https://example.com/up.git\n");
      const auto cfg = gitwire::load_config(gitdir);
      check(!cfg.thin_packs, "padded bool");
      check(cfg.ssh_command == "ssh", "ssh command untouched");
      check(cfg.remotes.size() == 1 && cfg.remotes.at("up") == "https://example.com/up.git",
            "remote parsed");
    }

    // Malformed files
    write_conf(gitdir, "thin-pack: maybe\n");
    check_throws<gitwire::GitError>([&] { (void)gitwire::load_config(gitdir); }, "bad bool");
    write_conf(gitdir, "ssh-command\n");
    check_throws<gitwire::GitError>([&] { (void)gitwire::load_config(gitdir); }, "no colon");

    // Remote names resolve to URLs, anything else passes through
    {
      gitwire::ClientConfig cfg;
      cfg.remotes["origin"] = "ssh://git@example.com/repo.git";
      check(gitwire::resolve_remote(cfg, "origin") == "ssh://git@example.com/repo.git",
            "named remote");
      check(gitwire::resolve_remote(cfg, "/srv/repo.git") == "/srv/repo.git", "plain path");
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    std::filesystem::remove_all(gitdir);
    return 1;
  }
  std::filesystem::remove_all(gitdir);
  return 0;
}
