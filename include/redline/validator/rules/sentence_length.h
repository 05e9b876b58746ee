#pragma once

#include "redline/validator/validator.h"

namespace redline::validator {

// SentenceLength: a sentence may hold at most max_len characters (default 120).
class SentenceLengthValidator final : public SentenceValidator {
 public:
  SentenceLengthValidator() = default;

  [[nodiscard]] std::vector<ValidationError> Validate(const domain::Sentence& sentence) override;

  [[nodiscard]] int max_length() const noexcept { return max_length_; }

 protected:
  void init() override;

 private:
  int max_length_{120};
};

}  // namespace redline::validator
