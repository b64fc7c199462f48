#include "cli/command.hpp"
#include "cli/context.hpp"

#include "gitwire/object_store.hpp"
#include "gitwire/refs.hpp"

#include <iostream>
#include <set>
#include <string>

namespace gitwire::cli {

namespace {

constexpr std::string_view kHeadsPrefix = "refs/heads/";

} // namespace

int fetch_pack(const Args &args) {
  if (args.empty() || args.size() > 2) {
    throw UsageError("");
  }
  const auto git_dir = git_dir_of(require_worktree_root());
  const auto cfg = load_config(git_dir);
  const std::string &remote = args[0];
  std::string name = "origin";
  if (args.size() == 2) {
    name = args[1];
  } else if (cfg.remotes.contains(remote)) {
    name = remote;
  }

  auto [client, path] = open_remote(cfg, remote);
  LooseObjectStore store{git_dir};

  // Received packs are kept as-is, so tips we already recorded count as present.
  std::set<oid> known;
  for (const auto &[ref, id] : read_loose_refs(git_dir)) {
    known.insert(id);
  }
  const auto wants = [&](const RefMap &refs) {
    std::vector<oid> out;
    for (const auto &id : store.determine_wants_all(refs)) {
      if (!known.contains(id)) {
        out.push_back(id);
      }
    }
    return out;
  };

  const auto refs = client->fetch(path, store, wants, print_progress);
  for (const auto &[ref, id] : refs) {
    if (!ref.starts_with(kHeadsPrefix)) {
      continue;
    }
    const std::string tracking = "refs/remotes/" + name + "/" + ref.substr(kHeadsPrefix.size());
    update_ref(git_dir, tracking, id);
    std::cout << to_hex(id) << ' ' << tracking << "\n";
  }
  return 0;
}

} // namespace gitwire::cli
