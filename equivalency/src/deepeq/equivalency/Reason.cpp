#include "deepeq/equivalency/Reason.hpp"

#include "deepeq/diag/logging.hpp"
#include <fmt/args.h>

namespace deepeq::equivalency {

static memory::string trim(const memory::string &text) {
  const auto first = text.find_first_not_of(" \t\n");
  if (first == memory::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\n");
  return text.substr(first, last - first + 1);
}

memory::string Reason::render() const {
  if (m_phrase.empty()) {
    return {};
  }

  memory::string formatted;
  if (m_args.empty()) {
    formatted = m_phrase;
  } else {
    fmt::dynamic_format_arg_store<fmt::format_context> store;
    for (const memory::string &arg : m_args) {
      store.push_back(arg);
    }
    try {
      formatted = fmt::vformat(m_phrase, store);
    } catch (const fmt::format_error &e) {
      DEEPEQ_WARN("reason \"{}\" does not match its {} argument(s): {}",
                  m_phrase, m_args.size(), e.what());
      formatted = m_phrase;
    }
  }

  memory::string clause = trim(formatted);
  if (clause.empty()) {
    return {};
  }
  if (!clause.starts_with("because")) {
    clause = "because " + clause;
  }
  return " " + clause;
}

} // namespace deepeq::equivalency
