#include "redline/core/errors.h"
#include "redline/engine/validation_engine.h"
#include "redline/validator/validator_registry.h"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace redline;

namespace {

// Shared trace of probe activity; cleared by each test.
std::vector<std::string>& trace() {
  static std::vector<std::string> events;
  return events;
}

std::string tag_of(const validator::Validator& rule) {
  return rule.configuration().attribute_or("tag", rule.name());
}

class DocumentProbeValidator final : public validator::DocumentValidator {
 public:
  std::vector<validator::ValidationError> Validate(const domain::Document& /*document*/) override {
    return {make_error(tag_of(*this), 0)};
  }
};

class SectionProbeValidator final : public validator::SectionValidator {
 public:
  std::vector<validator::ValidationError> Validate(const domain::Section& section) override {
    return {make_error(tag_of(*this) + ":" + section.header_text(), 0)};
  }
};

// Reports every sentence as "<tag>:<content>".
class SentenceProbeValidator final : public validator::SentenceValidator {
 public:
  std::vector<validator::ValidationError> Validate(const domain::Sentence& sentence) override {
    return {make_error(sentence, tag_of(*this) + ":" + sentence.content())};
  }
};

// Records preprocessing and validation calls; reports nothing.
class PreprocessProbeValidator final : public validator::SentenceValidator,
                                       public validator::PreProcessor {
 public:
  void Preprocess(domain::Sentence& sentence) override {
    trace().push_back("pre:" + sentence.content());
    sentence.set_tokens({domain::TokenElement{"probe", 0}});
  }

  std::vector<validator::ValidationError> Validate(const domain::Sentence& sentence) override {
    trace().push_back("val:" + sentence.content() + ":" +
                      std::to_string(sentence.tokens().size()));
    return {};
  }
};

class ThrowingSentenceProbeValidator final : public validator::SentenceValidator {
 public:
  std::vector<validator::ValidationError> Validate(const domain::Sentence& /*sentence*/) override {
    throw std::runtime_error("rule failure");
  }
};

// Claims no target at all.
class UnknownProbeValidator final : public validator::Validator {
 public:
  [[nodiscard]] validator::ValidationTarget target() const noexcept override {
    return validator::ValidationTarget::kUnknown;
  }
};

// Claims sentences but implements no entity interface.
class MislabeledProbeValidator final : public validator::Validator {
 public:
  [[nodiscard]] validator::ValidationTarget target() const noexcept override {
    return validator::ValidationTarget::kSentence;
  }
};

validator::ValidatorRegistry probe_registry() {
  validator::RuleNamespace probes("probe");
  probes.add<DocumentProbeValidator, validator::DocumentValidator>("DocumentProbeValidator")
      .add<SectionProbeValidator, validator::SectionValidator>("SectionProbeValidator")
      .add<SentenceProbeValidator, validator::SentenceValidator>("SentenceProbeValidator")
      .add<SentenceProbeValidator, validator::SentenceValidator>("OtherSentenceProbeValidator")
      .add<PreprocessProbeValidator, validator::SentenceValidator>("PreprocessProbeValidator")
      .add<PreprocessProbeValidator, validator::SentenceValidator>("OtherPreprocessProbeValidator")
      .add<ThrowingSentenceProbeValidator, validator::SentenceValidator>(
          "ThrowingSentenceProbeValidator")
      .add<UnknownProbeValidator, validator::Validator>("UnknownProbeValidator")
      .add<MislabeledProbeValidator, validator::Validator>("MislabeledProbeValidator");

  validator::ValidatorRegistry registry;
  registry.add_namespace(std::move(probes));
  return registry;
}

config::Configuration configuration_of(const std::vector<std::string>& names) {
  config::Configuration configuration;
  for (const auto& name : names) {
    configuration.validator_configs.push_back(config::ValidatorConfiguration{name, {}});
  }
  return configuration;
}

class RecordingSink final : public sink::IResultSink {
 public:
  void flush_header() override { events.emplace_back("header"); }
  void flush_footer() override { events.emplace_back("footer"); }
  sink::SinkResult flush_error(const domain::Document& document,
                               const validator::ValidationError& error) override {
    events.push_back(error.message);
    documents.push_back(&document);
    return sink::SinkResult::ok(true);
  }

  std::vector<std::string> events;
  std::vector<const domain::Document*> documents;
};

class FailingSink final : public sink::IResultSink {
 public:
  void flush_header() override {}
  void flush_footer() override {}
  sink::SinkResult flush_error(const domain::Document& /*document*/,
                               const validator::ValidationError& /*error*/) override {
    return sink::SinkResult::err(sink::SinkError{"disk full"});
  }
};

class ThrowingSink final : public sink::IResultSink {
 public:
  void flush_header() override {}
  void flush_footer() override {}
  sink::SinkResult flush_error(const domain::Document& /*document*/,
                               const validator::ValidationError& /*error*/) override {
    throw std::runtime_error("connection lost");
  }
};

domain::Document single_sentence_document(const std::string& text) {
  domain::DocumentBuilder builder;
  builder.add_section(0).add_paragraph().add_sentence(domain::Sentence(text, 1));
  return builder.build();
}

std::size_t count_of(const std::string& haystack, const std::string& needle) {
  std::size_t count = 0;
  for (auto pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

}  // namespace

TEST_CASE("Every document gets a result entry", "[engine]") {
  auto sink = std::make_shared<RecordingSink>();
  engine::ValidationEngine engine(configuration_of({}), sink, probe_registry());

  auto collection = domain::DocumentCollection::Builder()
                        .add_document(single_sentence_document("One."))
                        .add_document(single_sentence_document("Two."))
                        .build();

  const auto results = engine.validate(collection);

  REQUIRE(results.size() == 2);
  CHECK(results.contains(collection[0]));
  CHECK(results.contains(collection[1]));
  CHECK(results.at(collection[0]).empty());
  CHECK(results.total_errors() == 0);
  CHECK(sink->events == std::vector<std::string>{"header", "footer"});
}

TEST_CASE("Empty collection still brackets the sink", "[engine]") {
  auto sink = std::make_shared<RecordingSink>();
  engine::ValidationEngine engine(configuration_of({"SentenceProbe"}), sink, probe_registry());

  auto collection = domain::DocumentCollection::Builder().build();
  const auto results = engine.validate(collection);

  CHECK(results.empty());
  CHECK(sink->events == std::vector<std::string>{"header", "footer"});
}

TEST_CASE("Built-in rule finding reaches results and sink", "[engine]") {
  config::Configuration configuration;
  configuration.validator_configs.push_back(
      config::ValidatorConfiguration{"SentenceLength", {{"max_len", "10"}}});

  auto sink = std::make_shared<RecordingSink>();
  engine::ValidationEngine engine(configuration, sink);

  auto collection = domain::DocumentCollection::Builder()
                        .add_document(single_sentence_document("This sentence is too long."))
                        .build();

  const auto results = engine.validate(collection);

  const auto& errors = results.at(collection[0]);
  REQUIRE(errors.size() == 1);
  CHECK(errors[0].validator_name == "SentenceLength");
  CHECK(errors[0].sentence == "This sentence is too long.");
  CHECK(errors[0].line_number == 1);
  CHECK(errors[0].document == &collection[0]);

  REQUIRE(sink->documents.size() == 1);
  CHECK(sink->documents[0] == &collection[0]);
  CHECK(sink->events.size() == 3);
}

TEST_CASE("Passes run document, section, then sentence rules", "[engine]") {
  // Configuration order is deliberately the reverse of pass order.
  auto sink = std::make_shared<RecordingSink>();
  engine::ValidationEngine engine(
      configuration_of({"SentenceProbe", "SectionProbe", "DocumentProbe"}), sink,
      probe_registry());

  REQUIRE(engine.document_validator_count() == 1);
  REQUIRE(engine.section_validator_count() == 1);
  REQUIRE(engine.sentence_validator_count() == 1);

  domain::DocumentBuilder builder;
  builder.add_section(1, {domain::Sentence("Head.", 1)})
      .add_paragraph()
      .add_sentence(domain::Sentence("Body.", 2));
  auto collection = domain::DocumentCollection::Builder().add_document(builder.build()).build();

  const auto results = engine.validate(collection);

  CHECK(sink->events == std::vector<std::string>{"header", "DocumentProbe",
                                                 "SectionProbe:Head.", "SentenceProbe:Body.",
                                                 "SentenceProbe:Head.", "footer"});
  CHECK(results.at(collection[0]).size() == 4);
}

TEST_CASE("Document rules run over all documents before section rules", "[engine]") {
  auto sink = std::make_shared<RecordingSink>();
  engine::ValidationEngine engine(configuration_of({"SectionProbe", "DocumentProbe"}), sink,
                                  probe_registry());

  auto collection = domain::DocumentCollection::Builder()
                        .add_document(single_sentence_document("One."))
                        .add_document(single_sentence_document("Two."))
                        .build();

  (void)engine.validate(collection);

  CHECK(sink->events == std::vector<std::string>{"header", "DocumentProbe", "DocumentProbe",
                                                 "SectionProbe:", "SectionProbe:", "footer"});
  REQUIRE(sink->documents.size() == 4);
  CHECK(sink->documents[0] == &collection[0]);
  CHECK(sink->documents[1] == &collection[1]);
  CHECK(sink->documents[2] == &collection[0]);
  CHECK(sink->documents[3] == &collection[1]);
}

TEST_CASE("Sentence containers are visited paragraphs, header, lists", "[engine]") {
  auto sink = std::make_shared<RecordingSink>();
  engine::ValidationEngine engine(configuration_of({"SentenceProbe"}), sink, probe_registry());

  domain::DocumentBuilder builder;
  builder.add_section(1, {domain::Sentence("H.", 1)})
      .add_list_block()
      .add_list_element(1, {domain::Sentence("L.", 4)})
      .add_paragraph()
      .add_sentence(domain::Sentence("P.", 2));
  auto collection = domain::DocumentCollection::Builder().add_document(builder.build()).build();

  (void)engine.validate(collection);

  CHECK(sink->events == std::vector<std::string>{"header", "SentenceProbe:P.", "SentenceProbe:H.",
                                                 "SentenceProbe:L.", "footer"});
}

TEST_CASE("Sentence rules run rule by rule within a container", "[engine]") {
  auto sink = std::make_shared<RecordingSink>();
  engine::ValidationEngine engine(configuration_of({"SentenceProbe", "OtherSentenceProbe"}), sink,
                                  probe_registry());

  domain::DocumentBuilder builder;
  builder.add_paragraph()
      .add_sentence(domain::Sentence("S1.", 1))
      .add_sentence(domain::Sentence("S2.", 1));
  auto collection = domain::DocumentCollection::Builder().add_document(builder.build()).build();

  (void)engine.validate(collection);

  CHECK(sink->events ==
        std::vector<std::string>{"header", "SentenceProbe:S1.", "SentenceProbe:S2.",
                                 "OtherSentenceProbe:S1.", "OtherSentenceProbe:S2.", "footer"});
}

TEST_CASE("Preprocessing covers the whole collection before validation", "[engine]") {
  trace().clear();

  auto sink = std::make_shared<RecordingSink>();
  engine::ValidationEngine engine(configuration_of({"PreprocessProbe"}), sink, probe_registry());
  REQUIRE(engine.preprocessor_count() == 1);

  auto collection = domain::DocumentCollection::Builder()
                        .add_document(single_sentence_document("A."))
                        .add_document(single_sentence_document("B."))
                        .build();

  (void)engine.validate(collection);

  CHECK(trace() == std::vector<std::string>{"pre:A.", "pre:B.", "val:A.:1", "val:B.:1"});
  CHECK(collection[0].sections[0].paragraphs[0].sentences[0].tokens().size() == 1);
}

TEST_CASE("Each preprocessor sees each sentence exactly once", "[engine]") {
  trace().clear();

  auto sink = std::make_shared<RecordingSink>();
  engine::ValidationEngine engine(configuration_of({"PreprocessProbe", "OtherPreprocessProbe"}),
                                  sink, probe_registry());
  REQUIRE(engine.preprocessor_count() == 2);

  auto collection = domain::DocumentCollection::Builder()
                        .add_document(single_sentence_document("A."))
                        .build();

  (void)engine.validate(collection);

  CHECK(trace() == std::vector<std::string>{"pre:A.", "pre:A.", "val:A.:1", "val:A.:1"});
}

TEST_CASE("Failed flushes are logged and findings are kept", "[engine]") {
  std::ostringstream log;
  config::Configuration configuration = configuration_of({"SentenceProbe"});

  SECTION("sink returns an error") {
    engine::ValidationEngine engine(configuration, std::make_shared<FailingSink>(),
                                    probe_registry(), log);

    domain::DocumentBuilder builder;
    builder.add_paragraph()
        .add_sentence(domain::Sentence("S1.", 1))
        .add_sentence(domain::Sentence("S2.", 1));
    auto collection = domain::DocumentCollection::Builder().add_document(builder.build()).build();

    const auto results = engine.validate(collection);

    CHECK(results.total_errors() == 2);
    CHECK(count_of(log.str(), "Failed to flush error") == 2);
    CHECK(count_of(log.str(), "Skipping to flush this error...") == 2);
    CHECK(log.str().find("disk full") != std::string::npos);
  }

  SECTION("sink throws") {
    engine::ValidationEngine engine(configuration, std::make_shared<ThrowingSink>(),
                                    probe_registry(), log);

    auto collection = domain::DocumentCollection::Builder()
                          .add_document(single_sentence_document("S1."))
                          .build();

    const auto results = engine.validate(collection);

    CHECK(results.total_errors() == 1);
    CHECK(log.str().find("connection lost") != std::string::npos);
  }
}

TEST_CASE("Failed flushes do not stop later sections or documents", "[engine]") {
  std::ostringstream log;
  engine::ValidationEngine engine(configuration_of({"SectionProbe"}),
                                  std::make_shared<FailingSink>(), probe_registry(), log);

  SECTION("one document with two sections") {
    domain::DocumentBuilder builder;
    builder.add_section(1, {domain::Sentence("First", 1)})
        .add_section(1, {domain::Sentence("Second", 3)});
    auto collection = domain::DocumentCollection::Builder().add_document(builder.build()).build();

    const auto results = engine.validate(collection);

    const auto& errors = results.at(collection[0]);
    REQUIRE(errors.size() == 2);
    CHECK(errors[0].message == "SectionProbe:First");
    CHECK(errors[1].message == "SectionProbe:Second");
    CHECK(count_of(log.str(), "Failed to flush error") == 2);
  }

  SECTION("two documents") {
    domain::DocumentBuilder builder;
    builder.add_section(1, {domain::Sentence("A1", 1)}).add_section(1, {domain::Sentence("A2", 2)});
    auto first = builder.build();
    builder.add_section(1, {domain::Sentence("B1", 1)});
    auto second = builder.build();
    auto collection = domain::DocumentCollection::Builder()
                          .add_document(std::move(first))
                          .add_document(std::move(second))
                          .build();

    const auto results = engine.validate(collection);

    CHECK(results.at(collection[0]).size() == 2);
    const auto& later = results.at(collection[1]);
    REQUIRE(later.size() == 1);
    CHECK(later[0].message == "SectionProbe:B1");
    CHECK(later[0].document == &collection[1]);
    CHECK(results.total_errors() == 3);
    CHECK(count_of(log.str(), "Skipping to flush this error...") == 3);
  }
}

TEST_CASE("Rule exceptions propagate out of validate", "[engine]") {
  engine::ValidationEngine engine(configuration_of({"ThrowingSentenceProbe"}),
                                  std::make_shared<RecordingSink>(), probe_registry());

  auto collection = domain::DocumentCollection::Builder()
                        .add_document(single_sentence_document("S1."))
                        .build();

  REQUIRE_THROWS_AS(engine.validate(collection), std::runtime_error);
}

TEST_CASE("Engine construction rejects unusable rules", "[engine]") {
  auto sink = std::make_shared<RecordingSink>();

  SECTION("unknown name") {
    REQUIRE_THROWS_AS(
        engine::ValidationEngine(configuration_of({"Missing"}), sink, probe_registry()),
        core::ConfigurationError);
  }

  SECTION("no target") {
    REQUIRE_THROWS_WITH(
        engine::ValidationEngine(configuration_of({"UnknownProbe"}), sink, probe_registry()),
        "No validator target for UnknownProbe block.");
  }

  SECTION("target without matching interface") {
    REQUIRE_THROWS_AS(
        engine::ValidationEngine(configuration_of({"MislabeledProbe"}), sink, probe_registry()),
        core::ConfigurationError);
  }

  SECTION("null sink") {
    REQUIRE_THROWS_AS(engine::ValidationEngine(configuration_of({}), nullptr, probe_registry()),
                      std::invalid_argument);
  }
}

TEST_CASE("Default registry rules are routed by target", "[engine]") {
  const engine::ValidationEngine validation_engine(
      configuration_of({"WordNumber", "SentenceLength", "ParagraphNumber", "DocumentLength"}),
      std::make_shared<sink::NullResultSink>());

  CHECK(validation_engine.document_validator_count() == 1);
  CHECK(validation_engine.section_validator_count() == 1);
  CHECK(validation_engine.sentence_validator_count() == 2);
  CHECK(validation_engine.preprocessor_count() == 1);
}
