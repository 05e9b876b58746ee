#pragma once

#include "redline/config/configuration.h"
#include "redline/config/symbol_table.h"
#include "redline/validator/validator.h"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace redline::validator {

// ValidatorFactory builds a ready-to-use rule: constructed and configured.
using ValidatorFactory = std::function<std::unique_ptr<Validator>(
    const config::ValidatorConfiguration&, const config::SymbolTable&)>;

// is_validator_base is true for the abstract bases a rule may derive from.
template <typename T>
struct is_validator_base : std::false_type {};

template <>
struct is_validator_base<Validator> : std::true_type {};

template <typename Entity>
struct is_validator_base<EntityValidator<Entity>> : std::true_type {};

struct RuleRegistration {
  std::string type_name;  // "SentenceLengthValidator"
  ValidatorFactory factory;
  // False when the rule specializes another concrete rule; such registrations
  // are rejected at resolve time.
  bool derives_from_base{true};
};

template <typename Rule>
std::unique_ptr<Validator> make_configured(const config::ValidatorConfiguration& configuration,
                                           const config::SymbolTable& symbol_table) {
  auto rule = std::make_unique<Rule>();
  rule->configure(configuration, symbol_table);
  return rule;
}

// RuleNamespace is one named table of rule registrations ("core", "sentence",
// "section"). Type names are unique within a namespace; a later registration
// under the same type name replaces the earlier one.
class RuleNamespace {
 public:
  explicit RuleNamespace(std::string name);

  // Registers Rule under type_name. Parent is the class Rule derives from; it
  // decides whether the registration satisfies the flat hierarchy constraint.
  // The check trusts the declared Parent: a rule deriving from a concrete rule
  // but registered with an abstract base as Parent is accepted.
  template <typename Rule, typename Parent>
  RuleNamespace& add(std::string type_name) {
    static_assert(std::is_base_of_v<Validator, Rule>, "rules must derive from Validator");
    static_assert(std::is_base_of_v<Parent, Rule>, "Parent must be a base of Rule");
    static_assert(std::is_default_constructible_v<Rule>, "rules must be default constructible");
    return add(RuleRegistration{std::move(type_name), &make_configured<Rule>,
                                is_validator_base<Parent>::value});
  }

  RuleNamespace& add(RuleRegistration registration);

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const RuleRegistration* find(std::string_view type_name) const;
  [[nodiscard]] std::size_t size() const noexcept { return registrations_.size(); }

 private:
  std::string name_;
  std::vector<RuleRegistration> registrations_;
};

// ValidatorRegistry resolves configured rule names to fresh rule instances.
//
// Namespaces are searched in the order they were added; the first namespace
// holding "<name>Validator" wins. Resolution never caches: every call builds
// a new instance.
class ValidatorRegistry {
 public:
  static constexpr std::string_view kValidatorSuffix = "Validator";

  ValidatorRegistry& add_namespace(RuleNamespace rule_namespace);

  // Throws core::ConfigurationError when no namespace knows the name,
  // core::StructuralError when the match specializes another concrete rule,
  // and core::ConstructionError when construction or init() fails.
  [[nodiscard]] std::unique_ptr<Validator> resolve(
      const config::ValidatorConfiguration& configuration,
      const config::SymbolTable& symbol_table) const;

  [[nodiscard]] const std::vector<RuleNamespace>& namespaces() const noexcept {
    return namespaces_;
  }

 private:
  std::vector<RuleNamespace> namespaces_;
};

// Registry holding the built-in rules in namespaces core, sentence, section.
[[nodiscard]] ValidatorRegistry make_default_registry();

}  // namespace redline::validator
