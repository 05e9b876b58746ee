#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace redline::domain {

// TokenElement is one word of a sentence as produced by a tokenizer.
// offset is the byte offset of surface within the sentence content.
struct TokenElement {
  std::string surface;
  std::size_t offset{0};

  bool operator==(const TokenElement&) const = default;
};

// Sentence is the smallest unit the engine validates.
//
// The text and source position are fixed at construction. The token list is
// the only mutable part: parsers fill it, and sentence preprocessors may fill
// it before validation starts. Nothing writes to a sentence once the
// validation pass has begun.
class Sentence {
 public:
  Sentence(std::string content, int line_number, int start_position_offset = 0,
           bool is_first_sentence = false);

  [[nodiscard]] const std::string& content() const noexcept { return content_; }
  [[nodiscard]] int line_number() const noexcept { return line_number_; }
  [[nodiscard]] int start_position_offset() const noexcept { return start_position_offset_; }

  // True for the first sentence of a paragraph, header or list element.
  [[nodiscard]] bool is_first_sentence() const noexcept { return is_first_sentence_; }

  [[nodiscard]] const std::vector<TokenElement>& tokens() const noexcept { return tokens_; }
  [[nodiscard]] bool has_tokens() const noexcept { return !tokens_.empty(); }
  void set_tokens(std::vector<TokenElement> tokens);

 private:
  std::string content_;
  int line_number_{0};
  int start_position_offset_{0};
  bool is_first_sentence_{false};
  std::vector<TokenElement> tokens_;
};

}  // namespace redline::domain
