#include "redline/validator/rules/word_number.h"

namespace redline::validator {

void WordNumberValidator::init() { max_words_ = int_attribute("max_num", max_words_); }

void WordNumberValidator::Preprocess(domain::Sentence& sentence) {
  if (!sentence.has_tokens()) {
    sentence.set_tokens(tokenizer_.tokenize(sentence.content()));
  }
}

std::vector<ValidationError> WordNumberValidator::Validate(const domain::Sentence& sentence) {
  std::vector<ValidationError> errors;
  const auto count = sentence.tokens().size();
  if (count > static_cast<std::size_t>(max_words_)) {
    errors.push_back(make_error(sentence, "The number of words (" + std::to_string(count) +
                                              ") exceeds the maximum of " +
                                              std::to_string(max_words_) + "."));
  }
  return errors;
}

}  // namespace redline::validator
