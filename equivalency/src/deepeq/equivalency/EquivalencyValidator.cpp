#include "deepeq/equivalency/EquivalencyValidator.hpp"

#include "deepeq/diag/invalid_argument.hpp"
#include "deepeq/diag/logging.hpp"
#include "deepeq/diag/unreachable.hpp"
#include <fmt/format.h>

namespace deepeq::equivalency {

ValidationSummary
EquivalencyValidator::assertEquality(const ComparisonContext &root) {
  m_summary = ValidationSummary{};
  DEEPEQ_DEBUG("comparing {} using {}", root.displayName(),
               root.configuration());
  validate(root);
  DEEPEQ_DEBUG("compared {}: {}", root.displayName(), m_summary);
  return m_summary;
}

void EquivalencyValidator::validate(const ComparisonContext &context) {
  ++m_summary.visitedNodes;

  if (context.containsCyclicReference()) {
    ++m_summary.cyclicReferences;
    DEEPEQ_DEBUG("cyclic reference at {}", context.displayName());
    context.handleCyclicReference();
    return;
  }

  if (exceedsMaxRecursionDepth(context)) {
    context.verification().failWith(
        "The maximum recursion depth of {} was reached at {}{reason}.",
        *context.configuration().maxRecursionDepth(), context.displayName());
    return;
  }

  if (context.subject().isNull() || context.expectation().isNull()) {
    assertNullEquality(context);
    return;
  }

  switch (context.subject().type().kind()) {
  case reflect::TypeKind::Value:
    assertValueEquality(context);
    return;
  case reflect::TypeKind::Sequence:
    assertSequenceEquality(context);
    return;
  case reflect::TypeKind::Object:
    assertMemberEquality(context);
    return;
  }
  diag::unreachable();
}

bool EquivalencyValidator::exceedsMaxRecursionDepth(
    const ComparisonContext &context) const {
  const auto maxDepth = context.configuration().maxRecursionDepth();
  return maxDepth.has_value() && context.ancestors().size() > *maxDepth;
}

void EquivalencyValidator::assertNullEquality(
    const ComparisonContext &context) {
  ++m_summary.leafComparisons;
  if (context.subject().isNull() != context.expectation().isNull()) {
    context.verification().failWith(
        "Expected {} to be {}{reason}, but found {}.", context.displayName(),
        context.expectation(), context.subject());
  }
}

void EquivalencyValidator::assertValueEquality(
    const ComparisonContext &context) {
  ++m_summary.leafComparisons;
  const reflect::Object &subject = context.subject();
  const reflect::Object &expectation = context.expectation();

  if (&subject.type() != &expectation.type()) {
    context.verification().failWith(
        "Expected {} to be {} of type {}{reason}, but found {} of type {}.",
        context.displayName(), expectation, expectation.type().name(),
        subject, subject.type().name());
    return;
  }
  if (!subject.type().equals(subject.address(), expectation.address())) {
    context.verification().failWith(
        "Expected {} to be {}{reason}, but found {}.", context.displayName(),
        expectation, subject);
  }
}

void EquivalencyValidator::assertSequenceEquality(
    const ComparisonContext &context) {
  const reflect::Object &subject = context.subject();
  const reflect::Object &expectation = context.expectation();

  if (!expectation.type().isSequence()) {
    context.verification().failWith(
        "Expected {} to be a collection{reason}, but found {}.",
        context.displayName(), expectation);
    return;
  }

  const std::size_t subjectCount = subject.type().size(subject.address());
  const std::size_t expectedCount =
      expectation.type().size(expectation.address());
  if (subjectCount != expectedCount) {
    context.verification().failWith(
        "Expected {} to be a collection with {} item(s){reason}, but found "
        "{}.",
        context.displayName(), expectedCount, subjectCount);
    return;
  }

  const memory::vector<reflect::Object> subjectItems =
      subject.type().items(subject.address());
  const memory::vector<reflect::Object> expectedItems =
      expectation.type().items(expectation.address());
  for (std::size_t i = 0; i < subjectCount; ++i) {
    validate(
        context.createForCollectionItem(i, subjectItems[i], expectedItems[i]));
  }
}

void EquivalencyValidator::assertMemberEquality(
    const ComparisonContext &context) {
  const MemberSet members = context.selectedMembers();
  if (members.empty()) {
    diag::invalid_argument(fmt::format(
        "no members of {} ({}) were selected for comparison, include some "
        "members or describe the type",
        context.displayName(), context.subject().type().name()));
  }

  for (const reflect::Member *member : members) {
    memory::optional<ComparisonContext> nested =
        context.createForNestedMember(*member);
    if (!nested.has_value()) {
      ++m_summary.skippedMembers;
      continue;
    }
    validate(*nested);
  }
}

} // namespace deepeq::equivalency
