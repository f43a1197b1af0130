#pragma once

#include "deepeq/memory/container/string.hpp"
#include "deepeq/memory/container/vector.hpp"

namespace deepeq::equivalency {

// Receives rendered failure messages.
class IFailureHandler {
public:
  virtual ~IFailureHandler() = default;

  virtual void handleFailure(const memory::string &message) = 0;
};

// Throws diag::AssertionFailure on the first failure.
class ThrowingFailureHandler final : public IFailureHandler {
public:
  static ThrowingFailureHandler &instance();

  void handleFailure(const memory::string &message) final;
};

// Records every failure so a traversal can report them all at once.
class CollectingFailureHandler final : public IFailureHandler {
public:
  void handleFailure(const memory::string &message) final;

  const memory::vector<memory::string> &failures() const { return m_failures; }
  bool empty() const { return m_failures.empty(); }
  void clear() { m_failures.clear(); }

  // one AssertionFailure carrying every recorded message, one per line.
  void throwIfAny() const;

private:
  memory::vector<memory::string> m_failures;
};

} // namespace deepeq::equivalency
