#pragma once

#include "redline/tokenization/whitespace_tokenizer.h"
#include "redline/validator/validator.h"

namespace redline::validator {

// WordNumber: a sentence may hold at most max_num words (default 30).
// As a preprocessor it tokenizes sentences that arrive without tokens, so the
// count always comes from the sentence's token list.
class WordNumberValidator final : public SentenceValidator, public PreProcessor {
 public:
  WordNumberValidator() = default;

  void Preprocess(domain::Sentence& sentence) override;

  [[nodiscard]] std::vector<ValidationError> Validate(const domain::Sentence& sentence) override;

 protected:
  void init() override;

 private:
  int max_words_{30};
  tokenization::WhitespaceTokenizer tokenizer_;
};

}  // namespace redline::validator
