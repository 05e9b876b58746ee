#pragma once

#include "redline/config/configuration.h"
#include "redline/domain/document.h"
#include "redline/engine/validation_results.h"
#include "redline/sink/result_sink.h"
#include "redline/validator/validator.h"
#include "redline/validator/validator_registry.h"

#include <cstddef>
#include <iostream>
#include <memory>
#include <ostream>
#include <vector>

namespace redline::engine {

// ValidationEngine runs configured rules over document collections.
//
// Construction resolves every configured rule through the registry, in
// configuration order, and files it into the document, section or sentence
// list according to its declared target. The lists never change afterwards.
//
// validate() is strictly ordered:
//   1. sink header
//   2. document rules, per document
//   3. section rules, per document, per section
//   4. sentence preprocessors, over every sentence of the collection
//   5. sentence rules, per document, per section, per sentence container
//   6. sink footer
// Within a pass rules run in registration order. Sentence containers of a
// section are visited as: paragraphs, header, list elements.
//
// Each finding is forwarded to the sink as soon as it is produced. Sink
// failures are logged to the diagnostic stream and never stop the run or drop
// the finding from the returned results. Exceptions thrown by rules propagate
// to the caller.
//
// Rules may keep state between calls, so one engine must not run two
// validate() calls concurrently.
class ValidationEngine {
 public:
  // Throws core::ConfigurationError / core::StructuralError /
  // core::ConstructionError from rule resolution, core::ConfigurationError for
  // rules without a usable target, and std::invalid_argument for a null sink.
  ValidationEngine(const config::Configuration& configuration,
                   std::shared_ptr<sink::IResultSink> sink,
                   const validator::ValidatorRegistry& registry, std::ostream& log = std::cerr);

  // Uses validator::make_default_registry().
  ValidationEngine(const config::Configuration& configuration,
                   std::shared_ptr<sink::IResultSink> sink);

  ValidationEngine(const ValidationEngine&) = delete;
  ValidationEngine& operator=(const ValidationEngine&) = delete;

  // Sentences of the collection may gain tokens during preprocessing; nothing
  // else in the collection is modified.
  [[nodiscard]] ValidationResults validate(domain::DocumentCollection& collection);

  [[nodiscard]] std::size_t document_validator_count() const noexcept {
    return document_validators_.size();
  }
  [[nodiscard]] std::size_t section_validator_count() const noexcept {
    return section_validators_.size();
  }
  [[nodiscard]] std::size_t sentence_validator_count() const noexcept {
    return sentence_validators_.size();
  }
  [[nodiscard]] std::size_t preprocessor_count() const noexcept { return preprocessors_.size(); }

 private:
  void load_validators(const config::Configuration& configuration,
                       const validator::ValidatorRegistry& registry);

  void run_document_validators(const domain::DocumentCollection& collection,
                               ValidationResults& results);
  void run_section_validators(const domain::DocumentCollection& collection,
                              ValidationResults& results);
  void run_sentence_preprocessors(domain::DocumentCollection& collection);
  void run_sentence_validators(const domain::DocumentCollection& collection,
                               ValidationResults& results);
  void validate_sentences(const domain::Document& document,
                          const std::vector<domain::Sentence>& sentences,
                          ValidationResults& results);

  // Stamps the owning document, forwards to the sink, and records the finding.
  void report(const domain::Document& document, validator::ValidationError error,
              ValidationResults& results);
  void flush_error(const domain::Document& document, const validator::ValidationError& error);

  std::shared_ptr<sink::IResultSink> sink_;
  std::ostream& log_;

  std::vector<std::unique_ptr<validator::DocumentValidator>> document_validators_;
  std::vector<std::unique_ptr<validator::SectionValidator>> section_validators_;
  std::vector<std::unique_ptr<validator::SentenceValidator>> sentence_validators_;
  // Non-owning; sentence rules that also implement PreProcessor, in
  // registration order.
  std::vector<validator::PreProcessor*> preprocessors_;
};

}  // namespace redline::engine
