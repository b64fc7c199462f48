#include "gitwire/tree_builder.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/object_store.hpp"
#include "gitwire/objects.hpp"

#include <map>
#include <string>
#include <utility>

namespace gitwire {

namespace {

// "a/b/c" -> ("a", "b/c"); "file" -> ("file", "")
auto split_first(const std::string &path) -> std::pair<std::string, std::string> {
  const auto slash = path.find('/');
  if (slash == std::string::npos) {
    return {path, {}};
  }
  return {path.substr(0, slash), path.substr(slash + 1)};
}

} // namespace

auto commit_tree(ObjectStore &store, const std::vector<BlobEntry> &blobs) -> oid {
  const auto build = [&](const auto &self, const std::vector<BlobEntry> &group) -> oid {
    std::map<std::string, std::vector<BlobEntry>> subdirs; // dirname -> child entries
    Tree tree;

    for (const auto &b : group) {
      auto [first, rest] = split_first(b.path);
      if (rest.empty()) {
        tree.add(std::move(first), b.mode, b.sha);
      } else {
        subdirs[first].push_back(BlobEntry{.path = std::move(rest), .sha = b.sha, .mode = b.mode});
      }
    }

    for (const auto &[dirname, children] : subdirs) {
      tree.add(dirname, consts::kModeTree, self(self, children));
    }

    return store.add_object(tree);
  };

  return build(build, blobs);
}

} // namespace gitwire
