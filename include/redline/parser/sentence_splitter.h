#pragma once

#include "redline/domain/sentence.h"
#include "redline/parser/sentence_boundary.h"
#include "redline/tokenization/tokenizer.h"

#include <string>
#include <vector>

namespace redline::parser {

// SourceLine is one physical line of input; number is 1-based.
struct SourceLine {
  std::string text;
  int number{1};
};

// split_sentences turns a block of consecutive lines (a paragraph, a heading,
// a list item) into sentences.
//
// - Sentences may span lines; the pieces are joined with one space, or with
//   nothing when either side of the join is non-ASCII.
// - A sentence's line number and start offset are those of its first
//   character.
// - Text after the last terminator becomes a final sentence.
// - The first sentence of the block is flagged is_first_sentence.
// - Every sentence is tokenized with tokenizer.
[[nodiscard]] std::vector<domain::Sentence> split_sentences(
    const std::vector<SourceLine>& lines, const SentenceBoundary& boundary,
    const tokenization::ITokenizer& tokenizer);

// split_lines breaks source text into numbered lines, accepting \n, \r\n and \r.
[[nodiscard]] std::vector<SourceLine> split_lines(const std::string& source);

}  // namespace redline::parser
