#include "deepeq/diag/AssertionFailure.hpp"
#include "deepeq/equivalency/ComparisonContext.hpp"
#include "deepeq/equivalency/MemberPath.hpp"
#include "deepeq/equivalency/rules/AllDeclaredMembersSelectionRule.hpp"
#include "deepeq/equivalency/rules/ExcludeMemberByPathSelectionRule.hpp"
#include "deepeq/equivalency/rules/TryMatchByNameRule.hpp"
#include "equivalency/TestTypes.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

using namespace deepeq;
using namespace deepeq::equivalency;
using namespace deepeq::testing;

namespace {

struct Inner {
  int c = 0;
};

void deepeq_reflect(reflect::TypeBuilder<Inner> &b) {
  b.named("Inner").member("c", &Inner::c);
}

struct Middle {
  Inner b;
};

void deepeq_reflect(reflect::TypeBuilder<Middle> &b) {
  b.named("Middle").member("b", &Middle::b);
}

struct Outer {
  Middle a;
};

void deepeq_reflect(reflect::TypeBuilder<Outer> &b) {
  b.named("Outer").member("a", &Outer::a);
}

// counts its calls and never offers a counterpart.
class NeverMatchingRule final : public IMatchingRule {
public:
  explicit NeverMatchingRule(int *calls) : m_calls(calls) {}

  const reflect::Member *match(const reflect::Member &, const reflect::Object &,
                               memory::string_view,
                               const Verification &) const final {
    ++*m_calls;
    return nullptr;
  }

  memory::string describe() const final { return "never match"; }

private:
  int *m_calls;
};

const reflect::Member &member_of(const ComparisonContext &context,
                                 memory::string_view name) {
  const reflect::Member *member = context.subject().type().findMember(name);
  if (member == nullptr) {
    throw std::logic_error("no such member");
  }
  return *member;
}

ComparisonContext descend(const ComparisonContext &context,
                          memory::string_view name) {
  auto nested = context.createForNestedMember(member_of(context, name));
  if (!nested.has_value()) {
    throw std::logic_error("member was not matched");
  }
  return *nested;
}

} // namespace

TEST(equivalency_comparison_context, root_is_root) {
  Person bob = make_bob();
  Person other = make_bob();
  const Configuration config = Configuration::defaults();
  ComparisonContext root(config, reflect::borrow(bob), reflect::borrow(other));

  EXPECT_TRUE(root.isRoot());
  EXPECT_EQ(root.description(), "");
  EXPECT_EQ(root.path(), "");
  EXPECT_EQ(root.displayName(), "subject");
  EXPECT_EQ(root.subjectMember(), nullptr);
  EXPECT_EQ(root.matchedExpectationMember(), nullptr);
  EXPECT_TRUE(root.ancestors().empty());
  EXPECT_EQ(root.declaredType(),
            &reflect::TypeRegistry::global().describe<Person>());
}

TEST(equivalency_comparison_context, children_are_not_root) {
  Person bob = make_bob();
  Person other = make_bob();
  const Configuration config = Configuration::defaults();
  ComparisonContext root(config, reflect::borrow(bob), reflect::borrow(other));

  ComparisonContext name = descend(root, "Name");
  EXPECT_FALSE(name.isRoot());
  EXPECT_EQ(name.description(), "property Name");
  EXPECT_EQ(name.displayName(), "property Name");
  ASSERT_NE(name.subjectMember(), nullptr);
  EXPECT_EQ(name.subjectMember()->name(), "Name");
  ASSERT_NE(name.matchedExpectationMember(), nullptr);
  EXPECT_EQ(name.matchedExpectationMember()->name(), "Name");
  EXPECT_EQ(name.subject().address(), &bob.name);
  EXPECT_EQ(name.expectation().address(), &other.name);
}

TEST(equivalency_comparison_context, successive_descents_are_dot_joined) {
  Outer subject{Middle{Inner{1}}};
  Outer expectation{Middle{Inner{1}}};
  const Configuration config = Configuration::defaults();
  ComparisonContext root(config, reflect::borrow(subject),
                         reflect::borrow(expectation));

  ComparisonContext a = descend(root, "a");
  ComparisonContext b = descend(a, "b");
  ComparisonContext c = descend(b, "c");

  EXPECT_EQ(a.description(), "property a");
  EXPECT_EQ(b.description(), "property a.b");
  EXPECT_EQ(c.description(), "property a.b.c");
  EXPECT_EQ(c.path(), "a.b.c");

  EXPECT_EQ(c.path(), combine_path(combine_path("a", "b"), "c"));
  EXPECT_EQ(c.path(), combine_path("a", combine_path("b", "c")));
  EXPECT_EQ(c.description(), "property " + c.path());
}

TEST(equivalency_comparison_context, declared_type_is_runtime_type_of_child) {
  Outer subject;
  Outer expectation;
  const Configuration config = Configuration::defaults();
  ComparisonContext root(config, reflect::borrow(subject),
                         reflect::borrow(expectation));

  ComparisonContext a = descend(root, "a");
  EXPECT_EQ(a.declaredType(), &a.subject().type());
  EXPECT_EQ(a.declaredType()->name(), "Middle");
}

TEST(equivalency_comparison_context, collection_items_inherit_the_member) {
  Person subject{"Bob", Address{"Main", {"a", "b", "c"}}};
  Person expectation = subject;
  const Configuration config = Configuration::defaults();
  ComparisonContext root(config, reflect::borrow(subject),
                         reflect::borrow(expectation));

  ComparisonContext lines = descend(descend(root, "Address"), "Lines");
  ASSERT_EQ(lines.path(), "Address.Lines");

  const reflect::TypeDescriptor &type = lines.subject().type();
  ComparisonContext item = lines.createForCollectionItem(
      2, type.at(lines.subject().address(), 2),
      type.at(lines.expectation().address(), 2));

  EXPECT_EQ(item.description(), lines.description() + "[2]");
  EXPECT_EQ(item.description(), "property Address.Lines[2]");
  EXPECT_EQ(item.path(), "Address.Lines[2]");
  EXPECT_EQ(item.subjectMember(), lines.subjectMember());
  EXPECT_EQ(item.matchedExpectationMember(),
            lines.matchedExpectationMember());
  EXPECT_EQ(item.subject().address(), &subject.address.lines[2]);
  EXPECT_FALSE(item.isRoot());
}

TEST(equivalency_comparison_context, items_of_a_root_collection) {
  std::vector<int> subject{1, 2};
  std::vector<int> expectation{1, 2};
  const Configuration config = Configuration::defaults();
  ComparisonContext root(config, reflect::borrow(subject),
                         reflect::borrow(expectation));

  ComparisonContext item = root.createForCollectionItem(
      1, reflect::borrow(subject[1]), reflect::borrow(expectation[1]));
  EXPECT_EQ(item.description(), "item[1]");
  EXPECT_EQ(item.path(), "[1]");
  EXPECT_EQ(item.subjectMember(), nullptr);
  EXPECT_FALSE(item.isRoot());
}

TEST(equivalency_comparison_context, ancestors_grow_by_the_parent_subject) {
  Person bob = make_bob();
  Person other = make_bob();
  const Configuration config = Configuration::defaults();
  ComparisonContext root(config, reflect::borrow(bob), reflect::borrow(other));

  ComparisonContext address = descend(root, "Address");
  ComparisonContext street = descend(address, "Street");

  ASSERT_EQ(address.ancestors().size(), 1u);
  ASSERT_EQ(street.ancestors().size(), 2u);
  auto chain = street.ancestors().toVector();
  EXPECT_TRUE(chain[0].isSameAs(root.subject()));
  EXPECT_TRUE(chain[1].isSameAs(address.subject()));
  // siblings do not observe each other's entries.
  ComparisonContext name = descend(root, "Name");
  EXPECT_EQ(name.ancestors().size(), 1u);
  EXPECT_EQ(address.ancestors().size(), 1u);
}

TEST(equivalency_comparison_context, detects_cycle_at_depth_two) {
  Node a{1, nullptr};
  Node b{2, &a};
  a.next = &b;
  Node x{1, nullptr};
  Node y{2, &x};
  x.next = &y;

  const Configuration config = Configuration::defaults();
  ComparisonContext root(config, reflect::borrow(a), reflect::borrow(x));
  EXPECT_FALSE(root.containsCyclicReference());

  ComparisonContext depth1 = descend(root, "Next");
  EXPECT_EQ(depth1.subject().address(), &b);
  EXPECT_FALSE(depth1.containsCyclicReference());

  ComparisonContext depth2 = descend(depth1, "Next");
  EXPECT_EQ(depth2.subject().address(), &a);
  EXPECT_EQ(depth2.ancestors().size(), 2u);
  EXPECT_TRUE(depth2.containsCyclicReference());
}

TEST(equivalency_comparison_context, detects_cycle_through_a_base_view) {
  TaggedLink a;
  a.next = &a;
  TaggedLink x;
  x.next = &x;

  const Configuration config = Configuration::defaults();
  ComparisonContext root(config, reflect::borrow(a), reflect::borrow(x));
  ComparisonContext next = descend(root, "Next");
  EXPECT_EQ(next.subject().address(), &a);
  EXPECT_EQ(next.subject().type().name(), "Link");
  EXPECT_TRUE(next.containsCyclicReference());
}

TEST(equivalency_comparison_context, equal_values_are_not_cyclic) {
  Node a{1, nullptr};
  Node b{1, nullptr};
  a.next = &b;
  Node x{1, nullptr};
  Node y{1, nullptr};
  x.next = &y;

  const Configuration config = Configuration::defaults();
  ComparisonContext root(config, reflect::borrow(a), reflect::borrow(x));
  EXPECT_FALSE(descend(root, "Next").containsCyclicReference());
}

TEST(equivalency_comparison_context, absent_subjects_are_never_cyclic) {
  Node a{1, nullptr};
  Node x{1, nullptr};
  const Configuration config = Configuration::defaults();
  ComparisonContext root(config, reflect::borrow(a), reflect::borrow(x));
  ComparisonContext next = descend(root, "Next");
  EXPECT_TRUE(next.subject().isNull());
  EXPECT_FALSE(next.containsCyclicReference());
}

TEST(equivalency_comparison_context, selection_rules_form_a_pipeline) {
  Person bob = make_bob();
  Person other = make_bob();
  Configuration config = Configuration::empty();
  config.withSelectionRule(std::make_shared<AllDeclaredMembersSelectionRule>())
      .withSelectionRule(
          std::make_shared<ExcludeMemberByPathSelectionRule>("Name"));
  ComparisonContext root(config, reflect::borrow(bob), reflect::borrow(other));

  MemberSet members = root.selectedMembers();
  ASSERT_EQ(members.size(), 1u);
  EXPECT_EQ(members[0]->name(), "Address");
}

TEST(equivalency_comparison_context, no_selection_rules_select_nothing) {
  Person bob = make_bob();
  Person other = make_bob();
  const Configuration config = Configuration::empty();
  ComparisonContext root(config, reflect::borrow(bob), reflect::borrow(other));
  EXPECT_TRUE(root.selectedMembers().empty());
}

TEST(equivalency_comparison_context, selecting_members_of_null_throws) {
  const Configuration config = Configuration::defaults();
  Node present;
  ComparisonContext root(config, reflect::Object{}, reflect::borrow(present),
                         &reflect::TypeRegistry::global().describe<Node>());
  EXPECT_THROW(root.selectedMembers(), std::logic_error);
}

TEST(equivalency_comparison_context, first_successful_matching_rule_wins) {
  int neverCalls = 0;
  int lateCalls = 0;
  Configuration config = Configuration::defaults();
  config.clearMatchingRules()
      .withMatchingRule(std::make_shared<NeverMatchingRule>(&neverCalls))
      .withMatchingRule(std::make_shared<TryMatchByNameRule>())
      .withMatchingRule(std::make_shared<NeverMatchingRule>(&lateCalls));

  Person bob = make_bob();
  Person other = make_bob();
  ComparisonContext root(config, reflect::borrow(bob), reflect::borrow(other));

  auto name = root.createForNestedMember(member_of(root, "Name"));
  ASSERT_TRUE(name.has_value());
  EXPECT_EQ(name->matchedExpectationMember()->name(), "Name");
  EXPECT_EQ(neverCalls, 1);
  EXPECT_EQ(lateCalls, 0);
}

TEST(equivalency_comparison_context, unmatched_member_is_skipped) {
  int calls = 0;
  Configuration config = Configuration::defaults();
  config.clearMatchingRules().withMatchingRule(
      std::make_shared<NeverMatchingRule>(&calls));

  Person bob = make_bob();
  Person other = make_bob();
  ComparisonContext root(config, reflect::borrow(bob), reflect::borrow(other));
  EXPECT_FALSE(root.createForNestedMember(member_of(root, "Name")).has_value());
  EXPECT_EQ(calls, 1);
}

TEST(equivalency_comparison_context, missing_counterpart_fails_by_default) {
  PersonDto dto{"Bob", Address{"Main", {}}, 3};
  Person bob = make_bob();
  const Configuration config = Configuration::defaults();
  CollectingFailureHandler failures;
  ComparisonContext root(config, reflect::borrow(dto), reflect::borrow(bob),
                         nullptr, {}, failures);

  EXPECT_FALSE(
      root.createForNestedMember(member_of(root, "Version")).has_value());
  ASSERT_EQ(failures.failures().size(), 1u);
  EXPECT_EQ(failures.failures()[0],
            "Subject has member Version that the other object does not have.");
}

TEST(equivalency_comparison_context, cyclic_reference_fails_by_default) {
  Node a{1, nullptr};
  Node b{2, &a};
  a.next = &b;
  Node x{1, nullptr};
  Node y{2, &x};
  x.next = &y;

  const Configuration config = Configuration::defaults();
  CollectingFailureHandler failures;
  ComparisonContext root(config, reflect::borrow(a), reflect::borrow(x),
                         nullptr, {}, failures);
  ComparisonContext cyclic = descend(descend(root, "Next"), "Next");
  cyclic.handleCyclicReference();

  ASSERT_EQ(failures.failures().size(), 1u);
  EXPECT_EQ(failures.failures()[0],
            "Expected property Next.Next to be Node { Value = 1, Next = Node "
            "}, but it contains a cyclic reference.");
}

TEST(equivalency_comparison_context, cyclic_reference_ignored_on_request) {
  Node a{1, nullptr};
  a.next = &a;
  Node x{1, nullptr};
  x.next = &x;

  Configuration config = Configuration::defaults();
  config.ignoringCyclicReferences();
  CollectingFailureHandler failures;
  ComparisonContext root(config, reflect::borrow(a), reflect::borrow(x),
                         nullptr, {}, failures);
  ComparisonContext cyclic = descend(root, "Next");
  ASSERT_TRUE(cyclic.containsCyclicReference());
  cyclic.handleCyclicReference();
  EXPECT_TRUE(failures.empty());
}

TEST(equivalency_comparison_context, throwing_handler_is_the_default) {
  Node a{1, nullptr};
  a.next = &a;
  Node x{1, nullptr};
  x.next = &x;

  const Configuration config = Configuration::defaults();
  ComparisonContext root(config, reflect::borrow(a), reflect::borrow(x));
  EXPECT_THROW(descend(root, "Next").handleCyclicReference(),
               diag::AssertionFailure);
}

TEST(equivalency_comparison_context, reason_is_shared_with_children) {
  Person bob = make_bob();
  Person other = make_bob();
  const Configuration config = Configuration::defaults();
  CollectingFailureHandler failures;
  ComparisonContext root(config, reflect::borrow(bob), reflect::borrow(other),
                         nullptr, Reason::because("we want {} fields", 2),
                         failures);

  ComparisonContext street = descend(descend(root, "Address"), "Street");
  EXPECT_EQ(street.reason().render(), " because we want 2 fields");

  street.verification().failWith("Expected {} to match{reason}.",
                                 street.description());
  ASSERT_EQ(failures.failures().size(), 1u);
  EXPECT_EQ(failures.failures()[0],
            "Expected property Address.Street to match because we want 2 "
            "fields.");
}
