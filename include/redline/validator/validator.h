#pragma once

#include "redline/config/configuration.h"
#include "redline/config/symbol_table.h"
#include "redline/domain/document.h"
#include "redline/validator/validation_error.h"

#include <string>
#include <string_view>
#include <vector>

namespace redline::validator {

// ValidationTarget is the entity a rule inspects. The engine routes every
// rule into exactly one pass by reading this declaration.
enum class ValidationTarget {
  kUnknown,
  kDocument,
  kSection,
  kSentence,
};

[[nodiscard]] std::string_view to_string(ValidationTarget target) noexcept;

// Validator is the abstract base for all rules.
//
// Lifecycle: a rule is default-constructed and then configure()d exactly once
// by its registry factory, which runs the init() hook with options and
// symbols already in place. A rule is never used before configure().
//
// Concrete rules derive from DocumentValidator, SectionValidator or
// SentenceValidator (never from another concrete rule).
class Validator {
 public:
  virtual ~Validator() = default;

  [[nodiscard]] virtual ValidationTarget target() const noexcept = 0;

  void configure(const config::ValidatorConfiguration& configuration,
                 const config::SymbolTable& symbol_table);

  [[nodiscard]] const std::string& name() const noexcept { return configuration_.name; }
  [[nodiscard]] const config::ValidatorConfiguration& configuration() const noexcept {
    return configuration_;
  }
  [[nodiscard]] const config::SymbolTable& symbol_table() const noexcept { return symbol_table_; }

 protected:
  Validator() = default;
  Validator(const Validator&) = default;
  Validator& operator=(const Validator&) = default;
  Validator(Validator&&) = default;
  Validator& operator=(Validator&&) = default;

  // Reads options. Throws core::ConstructionError for unusable option values.
  virtual void init() {}

  // Non-negative integer option; throws core::ConstructionError when the value
  // is present but not a plain decimal number.
  [[nodiscard]] int int_attribute(const std::string& key, int fallback) const;

  // Configured symbol value, or the language default.
  [[nodiscard]] std::string symbol(std::string_view key) const;

  [[nodiscard]] ValidationError make_error(const domain::Sentence& sentence,
                                           std::string message) const;
  [[nodiscard]] ValidationError make_error(const domain::Sentence& sentence, std::string message,
                                           int start_position, int end_position) const;
  [[nodiscard]] ValidationError make_error(std::string message, int line_number) const;

 private:
  config::ValidatorConfiguration configuration_;
  config::SymbolTable symbol_table_;
};

template <typename Entity>
struct TargetOf;

template <>
struct TargetOf<domain::Document> {
  static constexpr ValidationTarget kValue = ValidationTarget::kDocument;
};

template <>
struct TargetOf<domain::Section> {
  static constexpr ValidationTarget kValue = ValidationTarget::kSection;
};

template <>
struct TargetOf<domain::Sentence> {
  static constexpr ValidationTarget kValue = ValidationTarget::kSentence;
};

// EntityValidator binds a rule to the entity type it validates.
// Validate may update rule-internal state; the engine calls it from one
// thread only.
template <typename Entity>
class EntityValidator : public Validator {
 public:
  using entity_type = Entity;

  [[nodiscard]] ValidationTarget target() const noexcept final { return TargetOf<Entity>::kValue; }

  [[nodiscard]] virtual std::vector<ValidationError> Validate(const Entity& entity) = 0;
};

using DocumentValidator = EntityValidator<domain::Document>;
using SectionValidator = EntityValidator<domain::Section>;
using SentenceValidator = EntityValidator<domain::Sentence>;

// PreProcessor is an optional capability of sentence rules. The engine calls
// Preprocess once per sentence, for the whole collection, before any sentence
// rule validates any sentence.
class PreProcessor {
 public:
  virtual ~PreProcessor() = default;

  virtual void Preprocess(domain::Sentence& sentence) = 0;

 protected:
  PreProcessor() = default;
  PreProcessor(const PreProcessor&) = default;
  PreProcessor& operator=(const PreProcessor&) = default;
  PreProcessor(PreProcessor&&) = default;
  PreProcessor& operator=(PreProcessor&&) = default;
};

}  // namespace redline::validator
