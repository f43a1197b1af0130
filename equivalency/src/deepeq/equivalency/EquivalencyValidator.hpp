#pragma once

#include "deepeq/equivalency/ComparisonContext.hpp"
#include "deepeq/equivalency/ValidationSummary.hpp"

namespace deepeq::equivalency {

/// Compares a subject graph against an expectation graph, starting from a
/// root context.
///
/// Cyclic nodes and members without a counterpart are not compared. Values
/// are compared with the equality of their type, sequences item by item in
/// order and objects member by member. Mismatches are reported through the
/// context's verification.
class EquivalencyValidator {
public:
  ValidationSummary assertEquality(const ComparisonContext &root);

private:
  void validate(const ComparisonContext &context);

  bool exceedsMaxRecursionDepth(const ComparisonContext &context) const;

  void assertNullEquality(const ComparisonContext &context);
  void assertValueEquality(const ComparisonContext &context);
  void assertSequenceEquality(const ComparisonContext &context);
  void assertMemberEquality(const ComparisonContext &context);

  ValidationSummary m_summary;
};

} // namespace deepeq::equivalency
