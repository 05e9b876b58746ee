#include "redline/validator/rules/doubled_word.h"

#include "redline/core/normalization.h"

#include <set>
#include <string>

namespace redline::validator {

void DoubledWordValidator::init() { min_length_ = int_attribute("min_len", min_length_); }

void DoubledWordValidator::Preprocess(domain::Sentence& sentence) {
  if (!sentence.has_tokens()) {
    sentence.set_tokens(tokenizer_.tokenize(sentence.content()));
  }
}

std::vector<ValidationError> DoubledWordValidator::Validate(const domain::Sentence& sentence) {
  std::vector<ValidationError> errors;
  std::set<std::string> seen;
  std::set<std::string> reported;

  for (const auto& token : sentence.tokens()) {
    if (core::utf8_length(token.surface) < static_cast<std::size_t>(min_length_)) {
      continue;
    }
    auto word = core::normalize_ascii_lower(token.surface);
    if (seen.insert(word).second) {
      continue;
    }
    if (reported.insert(word).second) {
      const auto start = static_cast<int>(token.offset);
      const auto end = static_cast<int>(token.offset + token.surface.size());
      errors.push_back(
          make_error(sentence, "Found repeated word \"" + token.surface + "\".", start, end));
    }
  }

  return errors;
}

}  // namespace redline::validator
