#include "redline/validator/validator_registry.h"

#include "redline/core/errors.h"
#include "redline/validator/rules/comma_number.h"
#include "redline/validator/rules/document_length.h"
#include "redline/validator/rules/doubled_word.h"
#include "redline/validator/rules/paragraph_number.h"
#include "redline/validator/rules/section_length.h"
#include "redline/validator/rules/sentence_length.h"
#include "redline/validator/rules/word_number.h"

#include <exception>
#include <utility>

namespace redline::validator {

RuleNamespace::RuleNamespace(std::string name) : name_(std::move(name)) {}

RuleNamespace& RuleNamespace::add(RuleRegistration registration) {
  for (auto& existing : registrations_) {
    if (existing.type_name == registration.type_name) {
      existing = std::move(registration);
      return *this;
    }
  }
  registrations_.push_back(std::move(registration));
  return *this;
}

const RuleRegistration* RuleNamespace::find(std::string_view type_name) const {
  for (const auto& registration : registrations_) {
    if (registration.type_name == type_name) {
      return &registration;
    }
  }
  return nullptr;
}

ValidatorRegistry& ValidatorRegistry::add_namespace(RuleNamespace rule_namespace) {
  namespaces_.push_back(std::move(rule_namespace));
  return *this;
}

std::unique_ptr<Validator> ValidatorRegistry::resolve(
    const config::ValidatorConfiguration& configuration,
    const config::SymbolTable& symbol_table) const {
  const std::string type_name = configuration.name + std::string(kValidatorSuffix);

  // First namespace holding the type name wins; later namespaces are not
  // consulted even if the match turns out to be unusable.
  for (const auto& rule_namespace : namespaces_) {
    const RuleRegistration* registration = rule_namespace.find(type_name);
    if (registration == nullptr) {
      continue;
    }

    const std::string qualified = rule_namespace.name() + "." + type_name;
    if (!registration->derives_from_base) {
      throw core::StructuralError(qualified +
                                  " doesn't derive directly from a validator base class");
    }
    if (!registration->factory) {
      throw core::ConstructionError(qualified + " has no factory");
    }

    std::unique_ptr<Validator> validator;
    try {
      validator = registration->factory(configuration, symbol_table);
    } catch (const core::ConstructionError&) {
      throw;
    } catch (const std::exception& e) {
      throw core::ConstructionError("Failed to construct " + qualified + ": " + e.what());
    }

    if (!validator) {
      throw core::ConstructionError("Failed to construct " + qualified +
                                    ": factory returned no instance");
    }
    return validator;
  }

  throw core::ConfigurationError("There is no such validator: " + configuration.name);
}

ValidatorRegistry make_default_registry() {
  ValidatorRegistry registry;

  RuleNamespace core_rules("core");
  core_rules.add<DocumentLengthValidator, DocumentValidator>("DocumentLengthValidator");

  RuleNamespace sentence_rules("sentence");
  sentence_rules.add<SentenceLengthValidator, SentenceValidator>("SentenceLengthValidator")
      .add<CommaNumberValidator, SentenceValidator>("CommaNumberValidator")
      .add<WordNumberValidator, SentenceValidator>("WordNumberValidator")
      .add<DoubledWordValidator, SentenceValidator>("DoubledWordValidator");

  RuleNamespace section_rules("section");
  section_rules.add<SectionLengthValidator, SectionValidator>("SectionLengthValidator")
      .add<ParagraphNumberValidator, SectionValidator>("ParagraphNumberValidator");

  // Search order: core, sentence, section.
  registry.add_namespace(std::move(core_rules))
      .add_namespace(std::move(sentence_rules))
      .add_namespace(std::move(section_rules));
  return registry;
}

}  // namespace redline::validator
