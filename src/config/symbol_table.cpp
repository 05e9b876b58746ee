#include "redline/config/symbol_table.h"

#include <utility>

namespace redline::config {

SymbolTable::SymbolTable(std::string language, std::map<std::string, std::string> symbols)
    : language_(std::move(language)), symbols_(symbols.begin(), symbols.end()) {}

bool SymbolTable::contains(std::string_view key) const {
  return symbols_.find(key) != symbols_.end();
}

std::optional<std::string> SymbolTable::value(std::string_view key) const {
  auto it = symbols_.find(key);
  if (it == symbols_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void SymbolTable::set(std::string key, std::string value) {
  symbols_.insert_or_assign(std::move(key), std::move(value));
}

DefaultSymbols::DefaultSymbols(std::map<std::string, std::string, std::less<>> symbols)
    : symbols_(std::move(symbols)) {}

DefaultSymbols DefaultSymbols::for_language(std::string_view language) {
  if (language == "ja") {
    return DefaultSymbols({
        {kFullStop, "\xE3\x80\x82"},                  // U+3002
        {kQuestionMark, "\xEF\xBC\x9F"},              // U+FF1F
        {kExclamationMark, "\xEF\xBC\x81"},           // U+FF01
        {kRightSingleQuotationMark, "\xE2\x80\x99"},  // U+2019
        {kRightDoubleQuotationMark, "\xE2\x80\x9D"},  // U+201D
        {kComma, "\xE3\x80\x81"},                     // U+3001
    });
  }

  return DefaultSymbols({
      {kFullStop, "."},
      {kQuestionMark, "?"},
      {kExclamationMark, "!"},
      {kRightSingleQuotationMark, "'"},
      {kRightDoubleQuotationMark, "\""},
      {kComma, ","},
  });
}

std::string DefaultSymbols::value(std::string_view key) const {
  auto it = symbols_.find(key);
  return it != symbols_.end() ? it->second : std::string{};
}

std::string resolve_symbol(const SymbolTable& table, const DefaultSymbols& defaults,
                           std::string_view key) {
  auto configured = table.value(key);
  if (configured.has_value()) {
    return *configured;
  }
  return defaults.value(key);
}

}  // namespace redline::config
