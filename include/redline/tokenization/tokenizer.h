#pragma once

#include "redline/domain/sentence.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace redline::tokenization {

/// Interface for sentence tokenizers used by parsers and preprocessing rules
class ITokenizer {
 public:
  virtual ~ITokenizer() = default;

  /// Split a sentence into words
  /// @param text Sentence content
  /// @return Tokens in encounter order with byte offsets into text
  [[nodiscard]] virtual std::vector<domain::TokenElement> tokenize(std::string_view text) const = 0;
};

/// Tokenizer for a configuration tokenizer name ("whitespace").
/// Throws core::ConfigurationError for unknown names.
[[nodiscard]] std::unique_ptr<ITokenizer> make_tokenizer(const std::string& name);

}  // namespace redline::tokenization
