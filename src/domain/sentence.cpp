#include "redline/domain/sentence.h"

#include <utility>

namespace redline::domain {

Sentence::Sentence(std::string content, int line_number, int start_position_offset,
                   bool is_first_sentence)
    : content_(std::move(content)),
      line_number_(line_number),
      start_position_offset_(start_position_offset),
      is_first_sentence_(is_first_sentence) {}

void Sentence::set_tokens(std::vector<TokenElement> tokens) { tokens_ = std::move(tokens); }

}  // namespace redline::domain
