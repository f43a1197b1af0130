#include "deepeq/equivalency/AncestorChain.hpp"

#include <algorithm>

namespace deepeq::equivalency {

AncestorChain AncestorChain::append(reflect::Object subject) const {
  return AncestorChain(std::make_shared<const Node>(
      Node{std::move(subject), m_head, size() + 1}));
}

bool AncestorChain::contains(const reflect::Object &subject) const {
  if (subject.isNull()) {
    return false;
  }
  for (const Node *node = m_head.get(); node != nullptr;
       node = node->parent.get()) {
    if (node->subject.isSameAs(subject)) {
      return true;
    }
  }
  return false;
}

memory::vector<reflect::Object> AncestorChain::toVector() const {
  memory::vector<reflect::Object> ancestors;
  ancestors.reserve(size());
  for (const Node *node = m_head.get(); node != nullptr;
       node = node->parent.get()) {
    ancestors.push_back(node->subject);
  }
  std::reverse(ancestors.begin(), ancestors.end());
  return ancestors;
}

} // namespace deepeq::equivalency
