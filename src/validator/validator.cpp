#include "redline/validator/validator.h"

#include "redline/core/errors.h"
#include "redline/core/normalization.h"

#include <utility>

namespace redline::validator {

std::string_view to_string(ValidationTarget target) noexcept {
  switch (target) {
    case ValidationTarget::kDocument:
      return "document";
    case ValidationTarget::kSection:
      return "section";
    case ValidationTarget::kSentence:
      return "sentence";
    case ValidationTarget::kUnknown:
      break;
  }
  return "unknown";
}

void Validator::configure(const config::ValidatorConfiguration& configuration,
                          const config::SymbolTable& symbol_table) {
  configuration_ = configuration;
  symbol_table_ = symbol_table;
  init();
}

int Validator::int_attribute(const std::string& key, int fallback) const {
  auto raw = configuration_.attribute(key);
  if (!raw.has_value()) {
    return fallback;
  }
  auto parsed = core::parse_non_negative_int(*raw);
  if (!parsed.has_value()) {
    throw core::ConstructionError(configuration_.name + ": option '" + key +
                                  "' must be a non-negative integer, got '" + *raw + "'");
  }
  return *parsed;
}

std::string Validator::symbol(std::string_view key) const {
  return config::resolve_symbol(symbol_table_,
                                config::DefaultSymbols::for_language(symbol_table_.language()), key);
}

ValidationError Validator::make_error(const domain::Sentence& sentence,
                                      std::string message) const {
  ValidationError error;
  error.validator_name = configuration_.name;
  error.message = std::move(message);
  error.sentence = sentence.content();
  error.line_number = sentence.line_number();
  return error;
}

ValidationError Validator::make_error(const domain::Sentence& sentence, std::string message,
                                      int start_position, int end_position) const {
  ValidationError error = make_error(sentence, std::move(message));
  error.start_position = start_position;
  error.end_position = end_position;
  return error;
}

ValidationError Validator::make_error(std::string message, int line_number) const {
  ValidationError error;
  error.validator_name = configuration_.name;
  error.message = std::move(message);
  error.line_number = line_number;
  return error;
}

}  // namespace redline::validator
