#pragma once

#include "redline/validator/validator.h"

#include <string>

namespace redline::validator {

// CommaNumber: a sentence may hold at most max_num commas (default 3).
// The comma is the COMMA symbol of the configured symbol table, so "、"
// is counted for Japanese configurations.
class CommaNumberValidator final : public SentenceValidator {
 public:
  CommaNumberValidator() = default;

  [[nodiscard]] std::vector<ValidationError> Validate(const domain::Sentence& sentence) override;

 protected:
  void init() override;

 private:
  int max_commas_{3};
  std::string comma_;
};

}  // namespace redline::validator
