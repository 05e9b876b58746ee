#include "redline/validator/rules/document_length.h"

#include "redline/core/normalization.h"

#include <cstddef>

namespace redline::validator {

void DocumentLengthValidator::init() { max_length_ = int_attribute("max_len", max_length_); }

std::vector<ValidationError> DocumentLengthValidator::Validate(const domain::Document& document) {
  std::size_t length = 0;
  for (const auto& section : document.sections) {
    domain::for_each_sentence_container(section, [&length](const auto& sentences) {
      for (const auto& sentence : sentences) {
        length += core::utf8_length(sentence.content());
      }
    });
  }

  std::vector<ValidationError> errors;
  if (length > static_cast<std::size_t>(max_length_)) {
    errors.push_back(make_error("The length of the document (" + std::to_string(length) +
                                    ") exceeds the maximum of " + std::to_string(max_length_) + ".",
                                0));
  }
  return errors;
}

}  // namespace redline::validator
