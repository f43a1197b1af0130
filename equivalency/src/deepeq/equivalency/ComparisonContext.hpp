#pragma once

#include "deepeq/equivalency/AncestorChain.hpp"
#include "deepeq/equivalency/Configuration.hpp"
#include "deepeq/equivalency/FailureHandler.hpp"
#include "deepeq/equivalency/Reason.hpp"
#include "deepeq/equivalency/Verification.hpp"
#include "deepeq/equivalency/rules/ISelectionRule.hpp"
#include "deepeq/memory/container/optional.hpp"
#include "deepeq/memory/container/shared_ptr.hpp"
#include "deepeq/memory/container/string.hpp"
#include "deepeq/memory/container/string_view.hpp"
#include "deepeq/reflect/Member.hpp"
#include "deepeq/reflect/Object.hpp"
#include "deepeq/reflect/TypeDescriptor.hpp"
#include <cstddef>

namespace deepeq::equivalency {

/// State of one node of the lockstep walk over a subject and an
/// expectation graph.
///
/// The root is constructed by the caller; every other context is produced
/// by createForNestedMember() or createForCollectionItem() of its parent.
/// Contexts are immutable and refer to the configuration and the failure
/// handler, which must outlive the traversal.
///
/// isRoot() <=> description().empty(). Member descriptors are null at the
/// root; collection items carry the descriptors of the member holding the
/// collection, so the items of a root collection have none either.
class ComparisonContext {
public:
  // `declaredType` defaults to the runtime type of `subject`.
  ComparisonContext(
      const Configuration &configuration, reflect::Object subject,
      reflect::Object expectation,
      const reflect::TypeDescriptor *declaredType = nullptr,
      Reason reason = {},
      IFailureHandler &failureHandler = ThrowingFailureHandler::instance());

  const Configuration &configuration() const { return *m_configuration; }

  const reflect::Object &subject() const { return m_subject; }
  const reflect::Object &expectation() const { return m_expectation; }

  const reflect::Member *subjectMember() const { return m_subjectMember; }
  const reflect::Member *matchedExpectationMember() const {
    return m_matchedExpectationMember;
  }

  const reflect::TypeDescriptor *declaredType() const {
    return m_declaredType;
  }

  // "Address.Lines[2]"
  const memory::string &path() const { return m_path; }
  // "property Address.Lines[2]"
  const memory::string &description() const { return m_description; }

  const Reason &reason() const { return *m_reason; }

  const AncestorChain &ancestors() const { return m_ancestors; }

  bool isRoot() const { return m_description.empty(); }

  // description, or "subject" for the root.
  memory::string displayName() const;

  Verification verification() const;

  // Runs the selection rules as a pipeline starting from an empty set; the
  // last rule's output is the result. The subject must be present.
  MemberSet selectedMembers() const;

  bool containsCyclicReference() const;

  // Fails under CyclicReferenceHandling::FailOnCycle, does nothing
  // otherwise.
  void handleCyclicReference() const;

  // nullopt when no matching rule finds a counterpart, the member is then
  // excluded from the comparison.
  memory::optional<ComparisonContext>
  createForNestedMember(const reflect::Member &member) const;

  ComparisonContext createForCollectionItem(std::size_t index,
                                            reflect::Object subject,
                                            reflect::Object expectation) const;

private:
  const reflect::Member *findMatchFor(const reflect::Member &member) const;

  ComparisonContext createNested(const reflect::Member *subjectMember,
                                 reflect::Object subject,
                                 const reflect::Member *expectationMember,
                                 reflect::Object expectation,
                                 memory::string_view memberType,
                                 memory::string_view memberLabel,
                                 memory::string_view separator) const;

  const Configuration *m_configuration;
  reflect::Object m_subject;
  reflect::Object m_expectation;
  const reflect::Member *m_subjectMember = nullptr;
  const reflect::Member *m_matchedExpectationMember = nullptr;
  const reflect::TypeDescriptor *m_declaredType;
  memory::string m_path;
  memory::string m_description;
  memory::shared_ptr<const Reason> m_reason;
  AncestorChain m_ancestors;
  IFailureHandler *m_failureHandler;
};

} // namespace deepeq::equivalency
