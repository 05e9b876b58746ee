#pragma once

#include "redline/config/symbol_table.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace redline::config {

// ValidatorConfiguration declares one rule: the rule name as written in the
// configuration file ("SentenceLength") and its options, all as strings.
struct ValidatorConfiguration {
  std::string name;
  std::map<std::string, std::string> attributes;

  [[nodiscard]] std::optional<std::string> attribute(const std::string& key) const;
  [[nodiscard]] std::string attribute_or(const std::string& key, const std::string& fallback) const;
};

// Configuration is the fully resolved input of engine construction.
// validator_configs order is the registration order of the rules.
struct Configuration {
  std::string language{"en"};
  std::string tokenizer{"whitespace"};
  SymbolTable symbol_table;
  std::vector<ValidatorConfiguration> validator_configs;
};

}  // namespace redline::config
