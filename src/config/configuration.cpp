#include "redline/config/configuration.h"

namespace redline::config {

std::optional<std::string> ValidatorConfiguration::attribute(const std::string& key) const {
  auto it = attributes.find(key);
  if (it == attributes.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string ValidatorConfiguration::attribute_or(const std::string& key,
                                                 const std::string& fallback) const {
  auto it = attributes.find(key);
  return it != attributes.end() ? it->second : fallback;
}

}  // namespace redline::config
