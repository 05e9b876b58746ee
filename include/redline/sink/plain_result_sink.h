#pragma once

#include "redline/sink/result_sink.h"

#include <ostream>

namespace redline::sink {

// PlainResultSink prints one line per finding:
//   <file>:<line>: ValidationError[Name], <message> at line: <line>, sentence: <text>
// Documents without a file name print "<input>".
class PlainResultSink final : public IResultSink {
 public:
  explicit PlainResultSink(std::ostream& out) : out_(out) {}

  void flush_header() override {}
  void flush_footer() override;
  [[nodiscard]] SinkResult flush_error(const domain::Document& document,
                                       const validator::ValidationError& error) override;

 private:
  std::ostream& out_;
};

}  // namespace redline::sink
