#pragma once
#include "gitwire/hash.hpp"
#include "gitwire/index.hpp"

#include <vector>

namespace gitwire {

class ObjectStore;

/**
 * Build and store the tree hierarchy for a flat list of staged blobs. Every
 * subtree is written to `store` before its parent. Returns the root tree id.
 * Entry order does not affect the result.
 */
auto commit_tree(ObjectStore &store, const std::vector<BlobEntry> &blobs) -> oid;

} // namespace gitwire
