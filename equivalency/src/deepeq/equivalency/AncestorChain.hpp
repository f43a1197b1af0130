#pragma once

#include "deepeq/memory/container/shared_ptr.hpp"
#include "deepeq/memory/container/vector.hpp"
#include "deepeq/reflect/Object.hpp"
#include <cstddef>

namespace deepeq::equivalency {

/// Persistent list of the subjects on the path from the root to a node.
///
/// append() returns a new chain sharing this one as its tail, so every
/// branch of a traversal owns its own view while the common prefix is
/// stored once.
class AncestorChain {
public:
  AncestorChain() = default;

  AncestorChain append(reflect::Object subject) const;

  // reference identity, never value equality.
  bool contains(const reflect::Object &subject) const;

  std::size_t size() const { return m_head == nullptr ? 0 : m_head->depth; }
  bool empty() const { return m_head == nullptr; }

  // root first.
  memory::vector<reflect::Object> toVector() const;

private:
  struct Node {
    reflect::Object subject;
    memory::shared_ptr<const Node> parent;
    std::size_t depth;
  };

  explicit AncestorChain(memory::shared_ptr<const Node> head)
      : m_head(std::move(head)) {}

  memory::shared_ptr<const Node> m_head;
};

} // namespace deepeq::equivalency
