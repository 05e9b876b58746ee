#pragma once

#include "redline/validator/validator.h"

namespace redline::validator {

// ParagraphNumber: a section may hold at most max_num paragraphs (default 5).
class ParagraphNumberValidator final : public SectionValidator {
 public:
  ParagraphNumberValidator() = default;

  [[nodiscard]] std::vector<ValidationError> Validate(const domain::Section& section) override;

 protected:
  void init() override;

 private:
  int max_paragraphs_{5};
};

}  // namespace redline::validator
