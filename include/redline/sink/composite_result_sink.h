#pragma once

#include "redline/sink/result_sink.h"

#include <memory>
#include <vector>

namespace redline::sink {

// CompositeResultSink forwards every call to each child sink in order. A
// finding is offered to all children even when an earlier one fails; the
// failures are joined into one SinkError.
class CompositeResultSink final : public IResultSink {
 public:
  explicit CompositeResultSink(std::vector<std::shared_ptr<IResultSink>> sinks);

  void flush_header() override;
  void flush_footer() override;
  [[nodiscard]] SinkResult flush_error(const domain::Document& document,
                                       const validator::ValidationError& error) override;

 private:
  std::vector<std::shared_ptr<IResultSink>> sinks_;
};

}  // namespace redline::sink
