#include "redline/sink/composite_result_sink.h"

#include <stdexcept>

namespace redline::sink {

CompositeResultSink::CompositeResultSink(std::vector<std::shared_ptr<IResultSink>> sinks)
    : sinks_(std::move(sinks)) {
  for (const auto& child : sinks_) {
    if (!child) {
      throw std::invalid_argument("CompositeResultSink does not accept null sinks");
    }
  }
}

void CompositeResultSink::flush_header() {
  for (const auto& child : sinks_) {
    child->flush_header();
  }
}

void CompositeResultSink::flush_footer() {
  for (const auto& child : sinks_) {
    child->flush_footer();
  }
}

SinkResult CompositeResultSink::flush_error(const domain::Document& document,
                                            const validator::ValidationError& error) {
  std::string failures;
  for (const auto& child : sinks_) {
    auto result = child->flush_error(document, error);
    if (!result.has_value()) {
      if (!failures.empty()) {
        failures += "; ";
      }
      failures += result.error().message;
    }
  }

  if (!failures.empty()) {
    return SinkResult::err(SinkError{failures});
  }
  return SinkResult::ok(true);
}

}  // namespace redline::sink
