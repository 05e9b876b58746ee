#pragma once

#include "redline/config/configuration.h"
#include "redline/core/result.h"

#include <nlohmann/json.hpp>

#include <string>

namespace redline::config {

// JSON configuration format:
//
//   {
//     "lang": "en",                       (optional, default "en")
//     "tokenizer": "whitespace",          (optional, default "whitespace")
//     "validators": [                     (required, array, order preserved)
//       {"name": "SentenceLength", "properties": {"max_len": 120}},
//       {"name": "CommaNumber"}
//     ],
//     "symbols": {"FULL_STOP": "."}       (optional, string values)
//   }
//
// Property values may be strings, numbers or booleans; they are stored as
// strings (numbers as their JSON text).

[[nodiscard]] core::Result<Configuration, std::string> parse_configuration(
    const nlohmann::json& j);

[[nodiscard]] core::Result<Configuration, std::string> parse_configuration_text(
    const std::string& text);

[[nodiscard]] core::Result<Configuration, std::string> load_configuration(
    const std::string& path);

}  // namespace redline::config
