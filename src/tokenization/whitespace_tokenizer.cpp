#include "redline/tokenization/whitespace_tokenizer.h"

#include "redline/core/errors.h"
#include "redline/core/normalization.h"

namespace redline::tokenization {

std::vector<domain::TokenElement> WhitespaceTokenizer::tokenize(std::string_view text) const {
  std::vector<domain::TokenElement> tokens;

  std::size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && core::is_ascii_space(text[pos])) {
      ++pos;
    }
    std::size_t chunk_end = pos;
    while (chunk_end < text.size() && !core::is_ascii_space(text[chunk_end])) {
      ++chunk_end;
    }

    std::size_t start = pos;
    std::size_t end = chunk_end;
    while (start < end && core::is_ascii_punct(text[start])) {
      ++start;
    }
    while (end > start && core::is_ascii_punct(text[end - 1])) {
      --end;
    }
    if (end > start) {
      tokens.push_back(domain::TokenElement{std::string{text.substr(start, end - start)}, start});
    }

    pos = chunk_end;
  }

  return tokens;
}

std::unique_ptr<ITokenizer> make_tokenizer(const std::string& name) {
  if (name == "whitespace") {
    return std::make_unique<WhitespaceTokenizer>();
  }
  throw core::ConfigurationError("Unknown tokenizer: " + name + " (valid: whitespace)");
}

}  // namespace redline::tokenization
