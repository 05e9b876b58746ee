#pragma once

#include "redline/validator/validator.h"

namespace redline::validator {

// SectionLength: characters of the paragraph sentences of a section must not
// exceed max_num (default 1000). Headers and lists are not counted.
class SectionLengthValidator final : public SectionValidator {
 public:
  SectionLengthValidator() = default;

  [[nodiscard]] std::vector<ValidationError> Validate(const domain::Section& section) override;

 protected:
  void init() override;

 private:
  int max_length_{1000};
};

}  // namespace redline::validator
