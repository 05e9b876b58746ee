#pragma once

#include "redline/config/symbol_table.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace redline::parser {

// SentenceBoundary holds the symbols that end a sentence, derived once from a
// symbol table with language defaults for keys the table leaves unset.
//
// terminators(): FULL_STOP, QUESTION_MARK, EXCLAMATION_MARK (in that order)
// closing_quotations(): RIGHT_SINGLE_QUOTATION_MARK, RIGHT_DOUBLE_QUOTATION_MARK
//
// Immutable after construction.
class SentenceBoundary {
 public:
  SentenceBoundary(const config::SymbolTable& symbol_table, const config::DefaultSymbols& defaults);

  // Uses config::DefaultSymbols::for_language(symbol_table.language()).
  explicit SentenceBoundary(const config::SymbolTable& symbol_table);

  [[nodiscard]] const std::vector<std::string>& terminators() const noexcept {
    return terminators_;
  }
  [[nodiscard]] const std::vector<std::string>& closing_quotations() const noexcept {
    return closing_quotations_;
  }

  // Returns the position one past the end of the first sentence in text that
  // starts at or after from, or npos when text holds no terminator from there.
  // A sentence ends after its terminator plus any closing quotations or
  // closing brackets (")", "]") directly following it. "." in "3.14" (an ASCII
  // terminator followed by a non-space ASCII character) does not end a sentence.
  [[nodiscard]] std::size_t find_end(std::string_view text, std::size_t from = 0) const;

 private:
  std::vector<std::string> terminators_;
  std::vector<std::string> closing_quotations_;
};

}  // namespace redline::parser
