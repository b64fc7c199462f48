#pragma once
#include "gitwire/hash.hpp"

#include <deque>
#include <optional>
#include <set>
#include <vector>

namespace gitwire {

class ObjectStore;

/**
 * Source of "have" ids during fetch negotiation. next_have() returns nullopt
 * once exhausted and keeps doing so; ack() reports an id the server has in
 * common with us.
 */
class GraphWalker {
public:
  virtual ~GraphWalker() = default;
  virtual auto next_have() -> std::optional<oid> = 0;
  virtual void ack(const oid &id) = 0;
};

// Offers nothing. For clones into an empty store.
class EmptyGraphWalker : public GraphWalker {
public:
  auto next_have() -> std::optional<oid> override { return std::nullopt; }
  void ack(const oid &) override {}
};

/**
 * Walks commit history in a local store breadth-first from a set of heads.
 * Once an id is acknowledged, neither it nor its ancestors are offered again.
 */
class ObjectStoreGraphWalker : public GraphWalker {
public:
  ObjectStoreGraphWalker(const ObjectStore &store, const std::vector<oid> &heads);

  auto next_have() -> std::optional<oid> override;
  void ack(const oid &id) override;

private:
  [[nodiscard]] auto parents_of(const oid &id) const -> std::vector<oid>;

  const ObjectStore &store_;
  std::deque<oid> pending_;
  std::set<oid> queued_;
  std::set<oid> common_;
};

} // namespace gitwire
