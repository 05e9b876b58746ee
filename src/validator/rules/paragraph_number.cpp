#include "redline/validator/rules/paragraph_number.h"

namespace redline::validator {

void ParagraphNumberValidator::init() {
  max_paragraphs_ = int_attribute("max_num", max_paragraphs_);
}

std::vector<ValidationError> ParagraphNumberValidator::Validate(const domain::Section& section) {
  std::vector<ValidationError> errors;
  const auto count = section.paragraphs.size();
  if (count <= static_cast<std::size_t>(max_paragraphs_)) {
    return errors;
  }

  const std::string message = "The number of paragraphs in the section (" +
                              std::to_string(count) + ") exceeds the maximum of " +
                              std::to_string(max_paragraphs_) + ".";
  if (!section.header_contents.empty()) {
    errors.push_back(make_error(section.header_contents.front(), message));
  } else {
    errors.push_back(make_error(message, 0));
  }
  return errors;
}

}  // namespace redline::validator
