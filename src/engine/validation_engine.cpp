#include "redline/engine/validation_engine.h"

#include "redline/core/errors.h"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace redline::engine {

namespace {

// Transfers ownership to the typed interface the rule's target() promised.
// Returns null (and destroys the rule) when the rule does not implement it.
template <typename Typed>
std::unique_ptr<Typed> take_as(std::unique_ptr<validator::Validator> rule) {
  auto* typed = dynamic_cast<Typed*>(rule.get());
  if (typed == nullptr) {
    return nullptr;
  }
  rule.release();
  return std::unique_ptr<Typed>(typed);
}

}  // namespace

ValidationEngine::ValidationEngine(const config::Configuration& configuration,
                                   std::shared_ptr<sink::IResultSink> sink,
                                   const validator::ValidatorRegistry& registry, std::ostream& log)
    : sink_(std::move(sink)), log_(log) {
  if (!sink_) {
    throw std::invalid_argument("ValidationEngine requires a result sink");
  }
  load_validators(configuration, registry);
}

ValidationEngine::ValidationEngine(const config::Configuration& configuration,
                                   std::shared_ptr<sink::IResultSink> sink)
    : ValidationEngine(configuration, std::move(sink), validator::make_default_registry()) {}

void ValidationEngine::load_validators(const config::Configuration& configuration,
                                       const validator::ValidatorRegistry& registry) {
  for (const auto& validator_config : configuration.validator_configs) {
    auto rule = registry.resolve(validator_config, configuration.symbol_table);
    const auto target = rule->target();

    switch (target) {
      case validator::ValidationTarget::kDocument: {
        auto typed = take_as<validator::DocumentValidator>(std::move(rule));
        if (typed) {
          document_validators_.push_back(std::move(typed));
          continue;
        }
        break;
      }
      case validator::ValidationTarget::kSection: {
        auto typed = take_as<validator::SectionValidator>(std::move(rule));
        if (typed) {
          section_validators_.push_back(std::move(typed));
          continue;
        }
        break;
      }
      case validator::ValidationTarget::kSentence: {
        auto typed = take_as<validator::SentenceValidator>(std::move(rule));
        if (typed) {
          if (auto* preprocessor = dynamic_cast<validator::PreProcessor*>(typed.get())) {
            preprocessors_.push_back(preprocessor);
          }
          sentence_validators_.push_back(std::move(typed));
          continue;
        }
        break;
      }
      case validator::ValidationTarget::kUnknown:
        throw core::ConfigurationError("No validator target for " + validator_config.name +
                                       " block.");
    }

    throw core::ConfigurationError(validator_config.name + " declares a " +
                                   std::string(validator::to_string(target)) +
                                   " target but does not implement its validator interface.");
  }
}

ValidationResults ValidationEngine::validate(domain::DocumentCollection& collection) {
  sink_->flush_header();

  ValidationResults results;
  for (const auto& document : collection) {
    results.add_document(document);
  }

  run_document_validators(collection, results);
  run_section_validators(collection, results);
  run_sentence_preprocessors(collection);
  run_sentence_validators(collection, results);

  sink_->flush_footer();
  return results;
}

void ValidationEngine::run_document_validators(const domain::DocumentCollection& collection,
                                               ValidationResults& results) {
  for (const auto& document : collection) {
    for (const auto& rule : document_validators_) {
      for (auto& error : rule->Validate(document)) {
        report(document, std::move(error), results);
      }
    }
  }
}

void ValidationEngine::run_section_validators(const domain::DocumentCollection& collection,
                                              ValidationResults& results) {
  for (const auto& document : collection) {
    for (const auto& section : document.sections) {
      for (const auto& rule : section_validators_) {
        for (auto& error : rule->Validate(section)) {
          report(document, std::move(error), results);
        }
      }
    }
  }
}

void ValidationEngine::run_sentence_preprocessors(domain::DocumentCollection& collection) {
  if (preprocessors_.empty()) {
    return;
  }
  for (auto& document : collection) {
    for (auto& section : document.sections) {
      domain::for_each_sentence_container(section, [this](std::vector<domain::Sentence>& sentences) {
        for (auto* preprocessor : preprocessors_) {
          for (auto& sentence : sentences) {
            preprocessor->Preprocess(sentence);
          }
        }
      });
    }
  }
}

void ValidationEngine::run_sentence_validators(const domain::DocumentCollection& collection,
                                               ValidationResults& results) {
  for (const auto& document : collection) {
    for (const auto& section : document.sections) {
      domain::for_each_sentence_container(
          section, [this, &document, &results](const std::vector<domain::Sentence>& sentences) {
            validate_sentences(document, sentences, results);
          });
    }
  }
}

void ValidationEngine::validate_sentences(const domain::Document& document,
                                          const std::vector<domain::Sentence>& sentences,
                                          ValidationResults& results) {
  for (const auto& rule : sentence_validators_) {
    for (const auto& sentence : sentences) {
      for (auto& error : rule->Validate(sentence)) {
        report(document, std::move(error), results);
      }
    }
  }
}

void ValidationEngine::report(const domain::Document& document, validator::ValidationError error,
                              ValidationResults& results) {
  error.document = &document;
  flush_error(document, error);
  results.append(document, std::move(error));
}

void ValidationEngine::flush_error(const domain::Document& document,
                                   const validator::ValidationError& error) {
  // A failed flush skips only this finding's output; the run continues.
  try {
    auto flushed = sink_->flush_error(document, error);
    if (!flushed.has_value()) {
      log_ << "Failed to flush error: " << validator::describe(error) << " ("
           << flushed.error().message << ")\n"
           << "Skipping to flush this error...\n";
    }
  } catch (const std::exception& e) {
    log_ << "Failed to flush error: " << validator::describe(error) << " (" << e.what() << ")\n"
         << "Skipping to flush this error...\n";
  }
}

}  // namespace redline::engine
