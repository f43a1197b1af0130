#pragma once

#include "deepeq/equivalency/ComparisonContext.hpp"
#include "deepeq/equivalency/Configuration.hpp"
#include "deepeq/equivalency/EquivalencyValidator.hpp"
#include "deepeq/equivalency/FailureHandler.hpp"
#include "deepeq/equivalency/Reason.hpp"
#include "deepeq/equivalency/ValidationSummary.hpp"
#include "deepeq/reflect/TypeRegistry.hpp"
#include "deepeq/reflect/traits.hpp"
#include <type_traits>

namespace deepeq {

using equivalency::CollectingFailureHandler;
using equivalency::Configuration;
using equivalency::IFailureHandler;
using equivalency::Reason;
using equivalency::ValidationSummary;

namespace details {

template <typename T> struct declared_type {
  using type = T;
};
template <typename T>
  requires reflect::details::is_pointer_like_v<T>
struct declared_type<T> {
  using type = typename reflect::details::pointer_like<T>::element_type;
};

} // namespace details

/// Asserts that `subject` is structurally equivalent to `expectation` and
/// reports every mismatch to `failureHandler`. Pointer-like arguments are
/// compared by their pointees.
template <typename T, typename E>
ValidationSummary
should_be_equivalent_to(const T &subject, const E &expectation,
                        const Configuration &configuration,
                        IFailureHandler &failureHandler, Reason reason = {}) {
  reflect::TypeRegistry &registry = reflect::TypeRegistry::global();
  equivalency::ComparisonContext root(
      configuration, reflect::details::object_of(subject),
      reflect::details::object_of(expectation),
      &registry.describe<typename details::declared_type<T>::type>(),
      std::move(reason), failureHandler);
  equivalency::EquivalencyValidator validator;
  return validator.assertEquality(root);
}

// Throws diag::AssertionFailure on the first mismatch.
template <typename T, typename E>
ValidationSummary
should_be_equivalent_to(const T &subject, const E &expectation,
                        const Configuration &configuration =
                            Configuration::defaults(),
                        Reason reason = {}) {
  return should_be_equivalent_to(
      subject, expectation, configuration,
      equivalency::ThrowingFailureHandler::instance(), std::move(reason));
}

} // namespace deepeq
