#include "redline/parser/sentence_boundary.h"

#include "redline/core/normalization.h"

namespace redline::parser {

namespace {

// Length of the first symbol matching text at pos, 0 if none does.
std::size_t match_any(const std::vector<std::string>& symbols, std::string_view text,
                      std::size_t pos) {
  for (const auto& symbol : symbols) {
    if (!symbol.empty() && text.compare(pos, symbol.size(), symbol) == 0) {
      return symbol.size();
    }
  }
  return 0;
}

bool is_ascii(const char ch) { return static_cast<unsigned char>(ch) < 0x80U; }

bool is_closing_bracket(const char ch) { return ch == ')' || ch == ']'; }

}  // namespace

SentenceBoundary::SentenceBoundary(const config::SymbolTable& symbol_table,
                                   const config::DefaultSymbols& defaults) {
  for (const char* key : {config::kFullStop, config::kQuestionMark, config::kExclamationMark}) {
    terminators_.push_back(config::resolve_symbol(symbol_table, defaults, key));
  }
  for (const char* key :
       {config::kRightSingleQuotationMark, config::kRightDoubleQuotationMark}) {
    closing_quotations_.push_back(config::resolve_symbol(symbol_table, defaults, key));
  }
}

SentenceBoundary::SentenceBoundary(const config::SymbolTable& symbol_table)
    : SentenceBoundary(symbol_table,
                       config::DefaultSymbols::for_language(symbol_table.language())) {}

std::size_t SentenceBoundary::find_end(std::string_view text, std::size_t from) const {
  for (std::size_t pos = from; pos < text.size(); ++pos) {
    const std::size_t length = match_any(terminators_, text, pos);
    if (length == 0) {
      continue;
    }

    std::size_t end = pos + length;
    const bool single_ascii = length == 1 && is_ascii(text[pos]);

    // Absorb runs such as "?!" or "...", trailing closing quotations and
    // closing brackets: "(See the note.)".
    while (end < text.size()) {
      std::size_t next = match_any(terminators_, text, end);
      if (next == 0) {
        next = match_any(closing_quotations_, text, end);
      }
      if (next == 0 && is_closing_bracket(text[end])) {
        next = 1;
      }
      if (next == 0) {
        break;
      }
      end += next;
    }

    // "3.14", "e.g.": an ASCII terminator glued to the next ASCII word.
    if (single_ascii && end < text.size() && is_ascii(text[end]) &&
        !core::is_ascii_space(text[end])) {
      pos = end - 1;
      continue;
    }

    return end;
  }

  return std::string_view::npos;
}

}  // namespace redline::parser
