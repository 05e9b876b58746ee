#include "redline/validator/rules/sentence_length.h"

#include "redline/core/normalization.h"

namespace redline::validator {

void SentenceLengthValidator::init() { max_length_ = int_attribute("max_len", max_length_); }

std::vector<ValidationError> SentenceLengthValidator::Validate(const domain::Sentence& sentence) {
  std::vector<ValidationError> errors;
  const auto length = core::utf8_length(sentence.content());
  if (length > static_cast<std::size_t>(max_length_)) {
    errors.push_back(make_error(sentence, "The length of the sentence (" + std::to_string(length) +
                                              ") exceeds the maximum of " +
                                              std::to_string(max_length_) + "."));
  }
  return errors;
}

}  // namespace redline::validator
