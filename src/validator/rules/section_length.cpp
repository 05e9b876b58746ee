#include "redline/validator/rules/section_length.h"

#include "redline/core/normalization.h"

#include <cstddef>

namespace redline::validator {

void SectionLengthValidator::init() { max_length_ = int_attribute("max_num", max_length_); }

std::vector<ValidationError> SectionLengthValidator::Validate(const domain::Section& section) {
  std::size_t length = 0;
  for (const auto& paragraph : section.paragraphs) {
    for (const auto& sentence : paragraph.sentences) {
      length += core::utf8_length(sentence.content());
    }
  }

  std::vector<ValidationError> errors;
  if (length <= static_cast<std::size_t>(max_length_)) {
    return errors;
  }

  const std::string message = "The number of characters in the section (" +
                              std::to_string(length) + ") exceeds the maximum of " +
                              std::to_string(max_length_) + ".";
  // Anchor the finding on the header when there is one.
  if (!section.header_contents.empty()) {
    errors.push_back(make_error(section.header_contents.front(), message));
  } else if (!section.paragraphs.empty() && !section.paragraphs.front().sentences.empty()) {
    errors.push_back(make_error(section.paragraphs.front().sentences.front(), message));
  } else {
    errors.push_back(make_error(message, 0));
  }
  return errors;
}

}  // namespace redline::validator
