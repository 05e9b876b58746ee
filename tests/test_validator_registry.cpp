#include "redline/core/errors.h"
#include "redline/validator/rules/sentence_length.h"
#include "redline/validator/validator_registry.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace redline;

namespace {

class FirstProbeValidator final : public validator::SentenceValidator {
 public:
  std::vector<validator::ValidationError> Validate(const domain::Sentence& /*sentence*/) override {
    return {};
  }
};

class SecondProbeValidator final : public validator::SentenceValidator {
 public:
  std::vector<validator::ValidationError> Validate(const domain::Sentence& /*sentence*/) override {
    return {};
  }
};

// Concrete rule that another rule specializes.
class BaseProbeValidator : public validator::SentenceValidator {
 public:
  std::vector<validator::ValidationError> Validate(const domain::Sentence& /*sentence*/) override {
    return {};
  }
};

class SpecializedProbeValidator final : public BaseProbeValidator {};

class ThrowingProbeValidator final : public validator::SentenceValidator {
 public:
  std::vector<validator::ValidationError> Validate(const domain::Sentence& /*sentence*/) override {
    return {};
  }

 protected:
  void init() override { throw std::runtime_error("boom"); }
};

config::ValidatorConfiguration named(const std::string& name) {
  return config::ValidatorConfiguration{name, {}};
}

}  // namespace

TEST_CASE("Default registry resolves built-in rules", "[validator][registry]") {
  const auto registry = validator::make_default_registry();

  REQUIRE(registry.namespaces().size() == 3);
  CHECK(registry.namespaces()[0].name() == "core");
  CHECK(registry.namespaces()[1].name() == "sentence");
  CHECK(registry.namespaces()[2].name() == "section");

  SECTION("sentence rule") {
    auto rule = registry.resolve(named("SentenceLength"), config::SymbolTable());
    REQUIRE(rule != nullptr);
    CHECK(rule->name() == "SentenceLength");
    CHECK(rule->target() == validator::ValidationTarget::kSentence);
  }

  SECTION("section rule") {
    auto rule = registry.resolve(named("ParagraphNumber"), config::SymbolTable());
    CHECK(rule->target() == validator::ValidationTarget::kSection);
  }

  SECTION("document rule") {
    auto rule = registry.resolve(named("DocumentLength"), config::SymbolTable());
    CHECK(rule->target() == validator::ValidationTarget::kDocument);
  }
}

TEST_CASE("Registry applies options before returning the rule", "[validator][registry]") {
  const auto registry = validator::make_default_registry();

  auto rule = registry.resolve(config::ValidatorConfiguration{"SentenceLength", {{"max_len", "5"}}},
                               config::SymbolTable());

  auto* typed = dynamic_cast<validator::SentenceLengthValidator*>(rule.get());
  REQUIRE(typed != nullptr);
  CHECK(typed->max_length() == 5);
  CHECK(typed->configuration().attribute("max_len") == "5");
}

TEST_CASE("Registry builds a fresh instance on every call", "[validator][registry]") {
  const auto registry = validator::make_default_registry();

  auto first = registry.resolve(named("SentenceLength"), config::SymbolTable());
  auto second = registry.resolve(named("SentenceLength"), config::SymbolTable());

  CHECK(first.get() != second.get());
}

TEST_CASE("First namespace holding the name wins", "[validator][registry]") {
  validator::RuleNamespace first("first");
  first.add<FirstProbeValidator, validator::SentenceValidator>("ProbeValidator");
  validator::RuleNamespace second("second");
  second.add<SecondProbeValidator, validator::SentenceValidator>("ProbeValidator");

  SECTION("first, second") {
    validator::ValidatorRegistry registry;
    registry.add_namespace(first).add_namespace(second);

    auto rule = registry.resolve(named("Probe"), config::SymbolTable());
    CHECK(dynamic_cast<FirstProbeValidator*>(rule.get()) != nullptr);
  }

  SECTION("second, first") {
    validator::ValidatorRegistry registry;
    registry.add_namespace(second).add_namespace(first);

    auto rule = registry.resolve(named("Probe"), config::SymbolTable());
    CHECK(dynamic_cast<SecondProbeValidator*>(rule.get()) != nullptr);
  }
}

TEST_CASE("Later registration replaces one with the same name", "[validator][registry]") {
  validator::RuleNamespace probes("probe");
  probes.add<FirstProbeValidator, validator::SentenceValidator>("ProbeValidator")
      .add<SecondProbeValidator, validator::SentenceValidator>("ProbeValidator");

  CHECK(probes.size() == 1);

  validator::ValidatorRegistry registry;
  registry.add_namespace(probes);
  auto rule = registry.resolve(named("Probe"), config::SymbolTable());
  CHECK(dynamic_cast<SecondProbeValidator*>(rule.get()) != nullptr);
}

TEST_CASE("Unknown rule names are configuration errors", "[validator][registry]") {
  const auto registry = validator::make_default_registry();

  REQUIRE_THROWS_AS(registry.resolve(named("NoSuchRule"), config::SymbolTable()),
                    core::ConfigurationError);
  REQUIRE_THROWS_WITH(registry.resolve(named("NoSuchRule"), config::SymbolTable()),
                      "There is no such validator: NoSuchRule");
}

TEST_CASE("Rules specializing a concrete rule are rejected", "[validator][registry]") {
  validator::RuleNamespace probes("probe");
  probes.add<SpecializedProbeValidator, BaseProbeValidator>("SpecializedProbeValidator");
  validator::ValidatorRegistry registry;
  registry.add_namespace(probes);

  REQUIRE_THROWS_AS(registry.resolve(named("SpecializedProbe"), config::SymbolTable()),
                    core::StructuralError);
}

TEST_CASE("The structural check follows the declared parent", "[validator][registry]") {
  validator::RuleNamespace probes("probe");
  probes.add<SpecializedProbeValidator, BaseProbeValidator>("DeclaredConcrete")
      .add<SpecializedProbeValidator, validator::SentenceValidator>("DeclaredAbstract");

  REQUIRE(probes.find("DeclaredConcrete") != nullptr);
  CHECK_FALSE(probes.find("DeclaredConcrete")->derives_from_base);

  // The real inheritance chain is not inspected; the declared parent decides.
  REQUIRE(probes.find("DeclaredAbstract") != nullptr);
  CHECK(probes.find("DeclaredAbstract")->derives_from_base);
}

TEST_CASE("Construction failures are reported as ConstructionError", "[validator][registry]") {
  SECTION("init throws") {
    validator::RuleNamespace probes("probe");
    probes.add<ThrowingProbeValidator, validator::SentenceValidator>("ThrowingProbeValidator");
    validator::ValidatorRegistry registry;
    registry.add_namespace(probes);

    REQUIRE_THROWS_AS(registry.resolve(named("ThrowingProbe"), config::SymbolTable()),
                      core::ConstructionError);
  }

  SECTION("non-numeric option") {
    const auto registry = validator::make_default_registry();
    REQUIRE_THROWS_AS(
        registry.resolve(config::ValidatorConfiguration{"SentenceLength", {{"max_len", "ten"}}},
                         config::SymbolTable()),
        core::ConstructionError);
  }

  SECTION("factory returns nothing") {
    validator::RuleNamespace probes("probe");
    probes.add(validator::RuleRegistration{
        "EmptyValidator",
        [](const config::ValidatorConfiguration&, const config::SymbolTable&) {
          return std::unique_ptr<validator::Validator>{};
        },
        true});
    validator::ValidatorRegistry registry;
    registry.add_namespace(probes);

    REQUIRE_THROWS_AS(registry.resolve(named("Empty"), config::SymbolTable()),
                      core::ConstructionError);
  }
}
