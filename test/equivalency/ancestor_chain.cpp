#include "deepeq/equivalency/AncestorChain.hpp"
#include "deepeq/reflect/TypeRegistry.hpp"
#include "equivalency/TestTypes.hpp"
#include <gtest/gtest.h>

using namespace deepeq;
using namespace deepeq::equivalency;
using namespace deepeq::testing;

TEST(equivalency_ancestor_chain, empty_chain) {
  AncestorChain chain;
  EXPECT_TRUE(chain.empty());
  EXPECT_EQ(chain.size(), 0u);
  EXPECT_TRUE(chain.toVector().empty());
}

TEST(equivalency_ancestor_chain, append_leaves_the_tail_untouched) {
  Person bob = make_bob();
  AncestorChain root;
  AncestorChain one = root.append(reflect::borrow(bob));
  AncestorChain two = one.append(reflect::borrow(bob.address));

  EXPECT_TRUE(root.empty());
  EXPECT_EQ(one.size(), 1u);
  EXPECT_EQ(two.size(), 2u);

  auto ancestors = two.toVector();
  ASSERT_EQ(ancestors.size(), 2u);
  EXPECT_EQ(ancestors[0].address(), &bob);
  EXPECT_EQ(ancestors[1].address(), &bob.address);
}

TEST(equivalency_ancestor_chain, branches_are_independent) {
  Person bob = make_bob();
  AncestorChain parent = AncestorChain{}.append(reflect::borrow(bob));
  AncestorChain left = parent.append(reflect::borrow(bob.name));
  AncestorChain right = parent.append(reflect::borrow(bob.address));

  EXPECT_TRUE(left.contains(reflect::borrow(bob.name)));
  EXPECT_FALSE(left.contains(reflect::borrow(bob.address)));
  EXPECT_TRUE(right.contains(reflect::borrow(bob.address)));
  EXPECT_FALSE(parent.contains(reflect::borrow(bob.address)));
}

TEST(equivalency_ancestor_chain, contains_by_identity) {
  Person bob = make_bob();
  Person twin = make_bob();
  AncestorChain chain = AncestorChain{}.append(reflect::borrow(bob));

  EXPECT_TRUE(chain.contains(reflect::borrow(bob)));
  EXPECT_FALSE(chain.contains(reflect::borrow(twin)));
  // same address, different object.
  EXPECT_FALSE(chain.contains(reflect::borrow(bob.name)));
  EXPECT_FALSE(chain.contains(reflect::Object{}));
}
