#include "gitwire/consts.hpp"
#include "gitwire/index.hpp"
#include "gitwire/object_store.hpp"
#include "gitwire/objects.hpp"
#include "gitwire/tree_builder.hpp"

#include "test_util.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

using gitwire::BlobEntry;
using gitwire::MemoryObjectStore;

int main() {
  try {
    const auto h1 = oid_of('1');
    const auto h2 = oid_of('2');

    MemoryObjectStore store;
    const auto root = gitwire::commit_tree(store, {{.path = "a/b", .sha = h1, .mode = 0100644},
                                                   {.path = "a/c", .sha = h2, .mode = 0100755}});

    // Expected ids, built by hand
    gitwire::Tree sub;
    sub.add("b", 0100644, h1);
    sub.add("c", 0100755, h2);
    gitwire::Tree top;
    top.add("a", gitwire::consts::kModeTree, sub.id());
    check(root == top.id(), "root tree id");
    check(store.contains(sub.id()) && store.contains(top.id()), "both trees stored");
    check(store.size() == 2, "only trees stored");

    const auto entries = store.read_tree(root).entries();
    check(entries.size() == 1 && entries[0].name == "a" &&
              entries[0].mode == gitwire::consts::kModeTree,
          "root has one directory entry");

    // Input order does not matter
    MemoryObjectStore other;
    const auto again = gitwire::commit_tree(other, {{.path = "a/c", .sha = h2, .mode = 0100755},
                                                    {.path = "a/b", .sha = h1, .mode = 0100644}});
    check(again == root, "order independent");

    // Deeper nesting and canonical ordering of "x" vs "x.txt"
    std::vector<BlobEntry> blobs{{.path = "x.txt", .sha = h1, .mode = 0100644},
                                {.path = "x/y/z", .sha = h2, .mode = 0100644},
                                {.path = "top", .sha = h1, .mode = gitwire::consts::kModeSymlink}};
    const auto deep = gitwire::commit_tree(store, blobs);
    std::ranges::reverse(blobs);
    check(gitwire::commit_tree(other, blobs) == deep, "deep tree order independent");

    const auto flat = store.iter_tree_contents(deep);
    check(flat.size() == 3, "three leaves");
    bool saw_z = false;
    for (const auto &c : flat) {
      saw_z = saw_z || (c.path == "x/y/z" && c.id == h2);
    }
    check(saw_z, "nested leaf path");

    // Git sorts the subtree "x" as "x/", after "x.txt"
    const auto names = store.read_tree(deep).entries();
    check(names.size() == 3 && names[0].name == "top" && names[1].name == "x.txt" &&
              names[2].name == "x",
          "canonical order");

    // An empty index is the empty tree
    MemoryObjectStore empty;
    check(gitwire::to_hex(gitwire::commit_tree(empty, {})) ==
              "4b825dc642cb6eb9a060e54bf8d69288fbee4904",
          "empty tree id");

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
