#include "cli/registry.hpp"

namespace gitwire::cli {

auto builtin_commands() -> Registry {
  Registry r;
  r.add({.name = "ls-remote", .synopsis = "<url|remote>",
         .summary = "List the refs a remote advertises", .run = ls_remote});
  r.add({.name = "fetch-pack", .synopsis = "<url|remote> [<name>]",
         .summary = "Fetch missing objects, record refs/remotes/<name>/*", .run = fetch_pack});
  r.add({.name = "send-pack", .synopsis = "<url|remote> <ref>...",
         .summary = "Push local refs and the objects they need", .run = send_pack});
  r.add({.name = "ls-files", .synopsis = "[-s]", .summary = "List paths in the index",
         .run = ls_files});
  r.add({.name = "update-index", .synopsis = "<path>...",
         .summary = "Hash files into the store and stage them", .run = update_index});
  r.add({.name = "write-tree", .synopsis = "", .summary = "Write the index as a tree, print its id",
         .run = write_tree});
  r.add({.name = "diff-index", .synopsis = "<tree>",
         .summary = "Compare the index with a tree", .run = diff_index});
  r.add({.name = "remote", .synopsis = "[add <name> <url> | remove <name>]",
         .summary = "List or edit remotes in .git/gitwire.conf", .run = remote});
  return r;
}

} // namespace gitwire::cli
