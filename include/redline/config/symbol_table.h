#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace redline::config {

// Symbol keys understood by the built-in components.
constexpr const char* kFullStop = "FULL_STOP";
constexpr const char* kQuestionMark = "QUESTION_MARK";
constexpr const char* kExclamationMark = "EXCLAMATION_MARK";
constexpr const char* kRightSingleQuotationMark = "RIGHT_SINGLE_QUOTATION_MARK";
constexpr const char* kRightDoubleQuotationMark = "RIGHT_DOUBLE_QUOTATION_MARK";
constexpr const char* kComma = "COMMA";

// SymbolTable maps symbol keys to the literal strings a configuration chose
// for them. Keys absent from the table fall back to DefaultSymbols.
class SymbolTable {
 public:
  SymbolTable() = default;
  explicit SymbolTable(std::string language, std::map<std::string, std::string> symbols = {});

  [[nodiscard]] const std::string& language() const noexcept { return language_; }
  [[nodiscard]] bool contains(std::string_view key) const;
  [[nodiscard]] std::optional<std::string> value(std::string_view key) const;
  [[nodiscard]] const std::map<std::string, std::string, std::less<>>& symbols() const noexcept {
    return symbols_;
  }

  void set(std::string key, std::string value);

 private:
  std::string language_{"en"};
  std::map<std::string, std::string, std::less<>> symbols_;
};

// DefaultSymbols is the immutable per-language fallback table. It is a plain
// value: callers obtain one for a language and pass it where it is needed.
class DefaultSymbols {
 public:
  // Known languages: "en", "ja". Anything else yields the "en" table.
  [[nodiscard]] static DefaultSymbols for_language(std::string_view language);

  // Empty string when the key has no default.
  [[nodiscard]] std::string value(std::string_view key) const;

 private:
  explicit DefaultSymbols(std::map<std::string, std::string, std::less<>> symbols);

  std::map<std::string, std::string, std::less<>> symbols_;
};

// resolve_symbol returns the table's value for key, or the default.
[[nodiscard]] std::string resolve_symbol(const SymbolTable& table, const DefaultSymbols& defaults,
                                         std::string_view key);

}  // namespace redline::config
