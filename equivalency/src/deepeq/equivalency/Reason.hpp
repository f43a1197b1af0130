#pragma once

#include "deepeq/memory/container/string.hpp"
#include "deepeq/memory/container/vector.hpp"
#include <fmt/format.h>
#include <utility>

namespace deepeq::equivalency {

/// The "because ..." phrase of an assertion together with its arguments.
///
/// Arguments are rendered to strings when the reason is created, so a
/// Reason can be shared by every context of a traversal.
class Reason {
public:
  Reason() = default;

  template <typename... Args>
  static Reason because(memory::string phrase, Args &&...args) {
    Reason reason;
    reason.m_phrase = std::move(phrase);
    (reason.m_args.push_back(fmt::format("{}", std::forward<Args>(args))),
     ...);
    return reason;
  }

  const memory::string &phrase() const { return m_phrase; }
  const memory::vector<memory::string> &args() const { return m_args; }

  bool empty() const { return m_phrase.empty(); }

  // " because <phrase>" with the arguments applied, or "" without a phrase.
  // "because" is prepended unless the phrase already starts with it.
  memory::string render() const;

private:
  memory::string m_phrase;
  memory::vector<memory::string> m_args;
};

} // namespace deepeq::equivalency
