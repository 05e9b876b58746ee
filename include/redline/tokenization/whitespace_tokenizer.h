#pragma once

#include "redline/tokenization/tokenizer.h"

namespace redline::tokenization {

/// Deterministic whitespace tokenizer
/// Rules:
/// - Split on ASCII whitespace
/// - Strip leading and trailing ASCII punctuation from each chunk
/// - Drop chunks that are punctuation only
/// - Case and non-ASCII bytes are preserved
class WhitespaceTokenizer final : public ITokenizer {
 public:
  [[nodiscard]] std::vector<domain::TokenElement> tokenize(std::string_view text) const override;
};

}  // namespace redline::tokenization
