#pragma once

#include "redline/tokenization/whitespace_tokenizer.h"
#include "redline/validator/validator.h"

namespace redline::validator {

// DoubledWord: the same word must not appear twice in one sentence.
// Comparison is ASCII case-insensitive; words shorter than min_len
// (default 3) are ignored so articles and particles do not fire.
// Reports each repeated word once, at its second occurrence.
class DoubledWordValidator final : public SentenceValidator, public PreProcessor {
 public:
  DoubledWordValidator() = default;

  void Preprocess(domain::Sentence& sentence) override;

  [[nodiscard]] std::vector<ValidationError> Validate(const domain::Sentence& sentence) override;

 protected:
  void init() override;

 private:
  int min_length_{3};
  tokenization::WhitespaceTokenizer tokenizer_;
};

}  // namespace redline::validator
