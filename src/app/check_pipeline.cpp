#include "redline/app/check_pipeline.h"

#include "redline/core/errors.h"
#include "redline/engine/validation_engine.h"
#include "redline/ingest/source_adapter.h"
#include "redline/parser/sentence_boundary.h"
#include "redline/tokenization/tokenizer.h"
#include "redline/validator/validator_registry.h"

namespace redline::app {

core::Result<std::vector<parser::SourceDocument>, std::string> load_sources(
    const std::vector<std::string>& paths) {
  using SourcesResult = core::Result<std::vector<parser::SourceDocument>, std::string>;

  std::vector<parser::SourceDocument> sources;
  sources.reserve(paths.size());
  for (const auto& path : paths) {
    auto text = ingest::extract_file(path);
    if (!text.has_value()) {
      return SourcesResult::err(path + ": " + text.error().message);
    }
    sources.push_back(parser::SourceDocument{std::move(text.value()), path});
  }
  return SourcesResult::ok(std::move(sources));
}

core::Result<CheckResponse, std::string> run_check_pipeline(const CheckRequest& req,
                                                            std::shared_ptr<sink::IResultSink> sink,
                                                            std::ostream& log) {
  using CheckResult = core::Result<CheckResponse, std::string>;

  try {
    const auto registry = validator::make_default_registry();
    engine::ValidationEngine engine(req.configuration, std::move(sink), registry, log);

    const auto parser = parser::make_parser(req.parser);
    const auto tokenizer = tokenization::make_tokenizer(req.configuration.tokenizer);
    const parser::SentenceBoundary boundary(req.configuration.symbol_table);

    auto collection = parser::parse_all(*parser, req.sources, boundary, *tokenizer);
    const auto results = engine.validate(collection);

    return CheckResult::ok(CheckResponse{results.size(), results.total_errors()});
  } catch (const core::ConfigurationError& e) {
    return CheckResult::err(e.what());
  } catch (const core::ConstructionError& e) {
    return CheckResult::err(e.what());
  }
}

}  // namespace redline::app
