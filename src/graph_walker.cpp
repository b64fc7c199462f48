#include "gitwire/graph_walker.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/object_store.hpp"

namespace gitwire {

ObjectStoreGraphWalker::ObjectStoreGraphWalker(const ObjectStore &store,
                                               const std::vector<oid> &heads)
    : store_(store) {
  for (const auto &h : heads) {
    if (h != kZeroOid && queued_.insert(h).second) {
      pending_.push_back(h);
    }
  }
}

auto ObjectStoreGraphWalker::parents_of(const oid &id) const -> std::vector<oid> {
  if (!store_.contains(id)) {
    return {};
  }
  const auto obj = store_.read(id);
  if (obj.type != consts::kTypeCommit) {
    return {};
  }
  return parse_commit(obj.data).parents;
}

auto ObjectStoreGraphWalker::next_have() -> std::optional<oid> {
  while (!pending_.empty()) {
    const oid cur = pending_.front();
    pending_.pop_front();
    if (common_.contains(cur)) {
      continue;
    }
    for (const auto &p : parents_of(cur)) {
      if (queued_.insert(p).second) {
        pending_.push_back(p);
      }
    }
    return cur;
  }
  return std::nullopt;
}

void ObjectStoreGraphWalker::ack(const oid &id) {
  std::vector<oid> stack{id};
  while (!stack.empty()) {
    const oid cur = stack.back();
    stack.pop_back();
    if (!common_.insert(cur).second) {
      continue;
    }
    for (const auto &p : parents_of(cur)) {
      stack.push_back(p);
    }
  }
}

} // namespace gitwire
