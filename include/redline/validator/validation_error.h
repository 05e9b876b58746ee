#pragma once

#include <optional>
#include <string>

namespace redline::domain {
struct Document;
}

namespace redline::validator {

// ValidationError is one finding reported by a rule. It is a value returned
// from Validate calls and accumulated by the engine; it is never thrown.
//
// document is stamped by the engine before the finding is forwarded; rules
// leave it null.
struct ValidationError {
  std::string validator_name;
  std::string message;
  std::string sentence;
  int line_number{0};
  std::optional<int> start_position;
  std::optional<int> end_position;
  const domain::Document* document{nullptr};
};

// "ValidationError[SentenceLength], <message> at line: 3" style summary used by
// the plain sink and diagnostics.
[[nodiscard]] std::string describe(const ValidationError& error);

}  // namespace redline::validator
