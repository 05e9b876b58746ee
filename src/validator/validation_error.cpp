#include "redline/validator/validation_error.h"

namespace redline::validator {

std::string describe(const ValidationError& error) {
  std::string text = "ValidationError[" + error.validator_name + "], " + error.message +
                     " at line: " + std::to_string(error.line_number);
  if (!error.sentence.empty()) {
    text += ", sentence: " + error.sentence;
  }
  return text;
}

}  // namespace redline::validator
