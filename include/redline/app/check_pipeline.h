#pragma once

#include "redline/config/configuration.h"
#include "redline/core/result.h"
#include "redline/parser/document_parser.h"
#include "redline/sink/result_sink.h"

#include <cstddef>
#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace redline::app {

struct CheckRequest {
  config::Configuration configuration;
  std::vector<parser::SourceDocument> sources;
  std::string parser{"plain"};
};

struct CheckResponse {
  std::size_t documents{0};
  std::size_t findings{0};
};

// Read each path through the adapter matching its extension. The first file
// that cannot be read or extracted fails the whole load.
[[nodiscard]] core::Result<std::vector<parser::SourceDocument>, std::string> load_sources(
    const std::vector<std::string>& paths);

// Parse, validate and report one batch of sources.
//
// Setup problems (unknown rule, parser or tokenizer, bad rule options) come
// back as an error string; findings go to the sink and are counted in the
// response. Sink failures are written to log and do not fail the check.
[[nodiscard]] core::Result<CheckResponse, std::string> run_check_pipeline(
    const CheckRequest& req, std::shared_ptr<sink::IResultSink> sink,
    std::ostream& log = std::cerr);

}  // namespace redline::app
