#include "redline/validator/rules/comma_number.h"

#include "redline/config/symbol_table.h"
#include "redline/core/normalization.h"

namespace redline::validator {

void CommaNumberValidator::init() {
  max_commas_ = int_attribute("max_num", max_commas_);
  comma_ = symbol(config::kComma);
}

std::vector<ValidationError> CommaNumberValidator::Validate(const domain::Sentence& sentence) {
  std::vector<ValidationError> errors;
  const auto count = core::count_occurrences(sentence.content(), comma_);
  if (count > static_cast<std::size_t>(max_commas_)) {
    errors.push_back(make_error(sentence, "The number of commas (" + std::to_string(count) +
                                              ") exceeds the maximum of " +
                                              std::to_string(max_commas_) + "."));
  }
  return errors;
}

}  // namespace redline::validator
