#pragma once

#include "deepeq/equivalency/FailureHandler.hpp"
#include "deepeq/equivalency/Reason.hpp"
#include "deepeq/memory/container/shared_ptr.hpp"
#include "deepeq/memory/container/string.hpp"
#include "deepeq/memory/container/string_view.hpp"
#include "deepeq/reflect/to_string.hpp"
#include <fmt/format.h>
#include <utility>

namespace deepeq::equivalency {

/// Renders failure messages and hands them to a failure handler.
///
/// Templates use positional "{}" placeholders for their arguments and
/// "{reason}" for the reason clause:
///
///   verification.failWith("Expected {} to be {}{reason}, but found {}.",
///                         description, expectation, subject);
///
/// reflect::Object arguments are rendered with reflect::to_string.
class Verification {
public:
  explicit Verification(IFailureHandler &handler)
      : m_handler(&handler), m_reason(std::make_shared<const Reason>()) {}

  Verification(IFailureHandler &handler,
               memory::shared_ptr<const Reason> reason)
      : m_handler(&handler), m_reason(std::move(reason)) {}

  Verification &becauseOf(Reason reason) {
    m_reason = std::make_shared<const Reason>(std::move(reason));
    return *this;
  }

  const Reason &reason() const { return *m_reason; }

  template <typename... Args>
  void failWith(memory::string_view messageTemplate, Args &&...args) const {
    fail(fmt::format(fmt::runtime(messageTemplate),
                     std::forward<Args>(args)...,
                     fmt::arg("reason", m_reason->render())));
  }

  void fail(const memory::string &message) const;

private:
  IFailureHandler *m_handler;
  memory::shared_ptr<const Reason> m_reason;
};

} // namespace deepeq::equivalency
