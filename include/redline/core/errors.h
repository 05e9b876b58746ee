#pragma once

#include <stdexcept>
#include <string>

namespace redline::core {

// Fatal setup errors. They abort engine construction before any traversal
// begins. Findings in the inspected text are never reported this way.

// ConfigurationError: a rule name that resolves to nothing, a rule with no
// recognized target, or malformed configuration content.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// StructuralError: a registered rule is a specialization of another concrete
// rule. Rules must derive directly from one of the abstract validator bases.
class StructuralError : public ConfigurationError {
 public:
  explicit StructuralError(const std::string& message) : ConfigurationError(message) {}
};

// ConstructionError: a resolved rule could not be constructed or initialized
// (including option values that fail to parse).
class ConstructionError : public std::runtime_error {
 public:
  explicit ConstructionError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace redline::core
