#include "deepeq/equivalency/MemberPath.hpp"
#include <gtest/gtest.h>

using namespace deepeq::equivalency;

TEST(equivalency_member_path, root_member) {
  EXPECT_EQ(combine_path("", "Name"), "Name");
}

TEST(equivalency_member_path, nested_members_are_dot_joined) {
  EXPECT_EQ(combine_path("Address", "Street"), "Address.Street");
  EXPECT_EQ(combine_path("a.b", "c"), "a.b.c");
}

TEST(equivalency_member_path, subscripts_attach_directly) {
  EXPECT_EQ(combine_path("Address.Lines", "[2]"), "Address.Lines[2]");
  EXPECT_EQ(combine_path("", "[0]"), "[0]");
  EXPECT_EQ(combine_path("[0]", "Name"), "[0].Name");
}

TEST(equivalency_member_path, composition_is_associative) {
  EXPECT_EQ(combine_path(combine_path("a", "b"), "c"),
            combine_path("a", combine_path("b", "c")));
  EXPECT_EQ(combine_path(combine_path("Lines", "[1]"), "Text"),
            combine_path("Lines", combine_path("[1]", "Text")));
}
