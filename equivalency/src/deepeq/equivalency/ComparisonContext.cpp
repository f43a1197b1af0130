#include "deepeq/equivalency/ComparisonContext.hpp"

#include "deepeq/diag/invalid_state.hpp"
#include "deepeq/diag/logging.hpp"
#include "deepeq/equivalency/MemberPath.hpp"
#include "deepeq/equivalency/TypeInfo.hpp"
#include <fmt/format.h>

namespace deepeq::equivalency {

ComparisonContext::ComparisonContext(const Configuration &configuration,
                                     reflect::Object subject,
                                     reflect::Object expectation,
                                     const reflect::TypeDescriptor *declaredType,
                                     Reason reason,
                                     IFailureHandler &failureHandler)
    : m_configuration(&configuration), m_subject(std::move(subject)),
      m_expectation(std::move(expectation)),
      m_declaredType(declaredType != nullptr ? declaredType
                                             : m_subject.typeOrNull()),
      m_reason(std::make_shared<const Reason>(std::move(reason))),
      m_failureHandler(&failureHandler) {}

memory::string ComparisonContext::displayName() const {
  return isRoot() ? memory::string("subject") : m_description;
}

Verification ComparisonContext::verification() const {
  return Verification(*m_failureHandler, m_reason);
}

MemberSet ComparisonContext::selectedMembers() const {
  if (m_subject.isNull()) {
    diag::invalid_state(fmt::format(
        "cannot select the members of {}, the subject is absent",
        displayName()));
  }
  const TypeInfo info{m_declaredType, &m_subject.type(), m_path};
  MemberSet members;
  for (const Configuration::SelectionRulePtr &rule :
       m_configuration->selectionRules()) {
    members = rule->selectMembers(std::move(members), info);
  }
  return members;
}

bool ComparisonContext::containsCyclicReference() const {
  return m_ancestors.contains(m_subject);
}

void ComparisonContext::handleCyclicReference() const {
  if (m_configuration->cyclicReferenceHandling() ==
      CyclicReferenceHandling::FailOnCycle) {
    verification().failWith(
        "Expected {} to be {}{reason}, but it contains a cyclic reference.",
        m_description, m_expectation);
  } else {
    DEEPEQ_DEBUG("ignoring cyclic reference at {}", displayName());
  }
}

memory::optional<ComparisonContext>
ComparisonContext::createForNestedMember(const reflect::Member &member) const {
  const reflect::Member *match = findMatchFor(member);
  if (match == nullptr) {
    DEEPEQ_DEBUG("{} has no counterpart for member {}, skipping it",
                 displayName(), member.name());
    return memory::nullopt;
  }

  reflect::Object subject = member.read(m_subject);
  reflect::Object expectation = match->read(m_expectation);
  return createNested(&member, std::move(subject), match,
                      std::move(expectation), "property ", member.name(), ".");
}

const reflect::Member *
ComparisonContext::findMatchFor(const reflect::Member &member) const {
  const Verification verification = this->verification();
  for (const Configuration::MatchingRulePtr &rule :
       m_configuration->matchingRules()) {
    if (const reflect::Member *match =
            rule->match(member, m_expectation, m_description, verification);
        match != nullptr) {
      return match;
    }
  }
  return nullptr;
}

ComparisonContext
ComparisonContext::createForCollectionItem(std::size_t index,
                                           reflect::Object subject,
                                           reflect::Object expectation) const {
  return createNested(m_subjectMember, std::move(subject),
                      m_matchedExpectationMember, std::move(expectation),
                      "item", fmt::format("[{}]", index), "");
}

ComparisonContext ComparisonContext::createNested(
    const reflect::Member *subjectMember, reflect::Object subject,
    const reflect::Member *expectationMember, reflect::Object expectation,
    memory::string_view memberType, memory::string_view memberLabel,
    memory::string_view separator) const {
  ComparisonContext nested = *this;
  nested.m_subjectMember = subjectMember;
  nested.m_matchedExpectationMember = expectationMember;
  nested.m_declaredType = subject.typeOrNull();
  nested.m_subject = std::move(subject);
  nested.m_expectation = std::move(expectation);
  nested.m_path = combine_path(m_path, memberLabel);
  nested.m_description = isRoot() ? memory::string(memberType)
                                  : m_description + memory::string(separator);
  nested.m_description += memberLabel;
  nested.m_ancestors = m_ancestors.append(m_subject);

  DEEPEQ_TRACE("descending into {}", nested.m_description);
  return nested;
}

} // namespace deepeq::equivalency
