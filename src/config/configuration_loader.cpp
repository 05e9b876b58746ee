#include "redline/config/configuration_loader.h"

#include <fstream>
#include <sstream>

namespace redline::config {

namespace {

using ConfigResult = core::Result<Configuration, std::string>;

// Scalar JSON values become option strings; anything else is rejected.
core::Result<std::string, std::string> property_to_string(const std::string& key,
                                                          const nlohmann::json& value) {
  if (value.is_string()) {
    return core::Result<std::string, std::string>::ok(value.get<std::string>());
  }
  if (value.is_number() || value.is_boolean()) {
    return core::Result<std::string, std::string>::ok(value.dump());
  }
  return core::Result<std::string, std::string>::err("property '" + key +
                                                     "' must be a string, number or boolean");
}

core::Result<ValidatorConfiguration, std::string> parse_validator(const nlohmann::json& entry,
                                                                  std::size_t index) {
  using ValidatorResult = core::Result<ValidatorConfiguration, std::string>;
  const std::string where = "validators[" + std::to_string(index) + "]";

  if (!entry.is_object()) {
    return ValidatorResult::err(where + " must be an object");
  }
  if (!entry.contains("name") || !entry.at("name").is_string()) {
    return ValidatorResult::err(where + " requires a string \"name\"");
  }

  ValidatorConfiguration validator;
  validator.name = entry.at("name").get<std::string>();
  if (validator.name.empty()) {
    return ValidatorResult::err(where + " has an empty name");
  }

  if (entry.contains("properties")) {
    const auto& properties = entry.at("properties");
    if (!properties.is_object()) {
      return ValidatorResult::err(where + ".properties must be an object");
    }
    for (const auto& [key, value] : properties.items()) {
      auto converted = property_to_string(key, value);
      if (!converted.has_value()) {
        return ValidatorResult::err(where + ": " + converted.error());
      }
      validator.attributes[key] = converted.value();
    }
  }

  return ValidatorResult::ok(std::move(validator));
}

}  // namespace

ConfigResult parse_configuration(const nlohmann::json& j) {
  if (!j.is_object()) {
    return ConfigResult::err("configuration root must be an object");
  }

  Configuration configuration;

  if (j.contains("lang")) {
    if (!j.at("lang").is_string()) {
      return ConfigResult::err("\"lang\" must be a string");
    }
    configuration.language = j.at("lang").get<std::string>();
  }

  if (j.contains("tokenizer")) {
    if (!j.at("tokenizer").is_string()) {
      return ConfigResult::err("\"tokenizer\" must be a string");
    }
    configuration.tokenizer = j.at("tokenizer").get<std::string>();
  }

  if (!j.contains("validators") || !j.at("validators").is_array()) {
    return ConfigResult::err("\"validators\" array is required");
  }

  const auto& validators = j.at("validators");
  for (std::size_t i = 0; i < validators.size(); ++i) {
    auto validator = parse_validator(validators.at(i), i);
    if (!validator.has_value()) {
      return ConfigResult::err(validator.error());
    }
    configuration.validator_configs.push_back(validator.value());
  }

  SymbolTable symbol_table(configuration.language);
  if (j.contains("symbols")) {
    const auto& symbols = j.at("symbols");
    if (!symbols.is_object()) {
      return ConfigResult::err("\"symbols\" must be an object");
    }
    for (const auto& [key, value] : symbols.items()) {
      if (!value.is_string()) {
        return ConfigResult::err("symbol '" + key + "' must be a string");
      }
      symbol_table.set(key, value.get<std::string>());
    }
  }
  configuration.symbol_table = std::move(symbol_table);

  return ConfigResult::ok(std::move(configuration));
}

ConfigResult parse_configuration_text(const std::string& text) {
  const auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    return ConfigResult::err("configuration is not valid JSON");
  }
  return parse_configuration(j);
}

ConfigResult load_configuration(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return ConfigResult::err("cannot open configuration file: " + path);
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();

  auto result = parse_configuration_text(buffer.str());
  if (!result.has_value()) {
    return ConfigResult::err(path + ": " + result.error());
  }
  return result;
}

}  // namespace redline::config
