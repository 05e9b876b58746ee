#pragma once

#include "redline/sink/result_sink.h"

#include <nlohmann/json.hpp>

#include <ostream>

namespace redline::sink {

// Serialize one finding; "file" is null for unnamed documents and positions
// are null when the rule reported none.
[[nodiscard]] nlohmann::json to_json(const domain::Document& document,
                                     const validator::ValidationError& error);

// JsonResultSink streams findings as a JSON array: "[" on header, one object
// per finding, "]" on footer.
class JsonResultSink final : public IResultSink {
 public:
  explicit JsonResultSink(std::ostream& out) : out_(out) {}

  void flush_header() override;
  void flush_footer() override;
  [[nodiscard]] SinkResult flush_error(const domain::Document& document,
                                       const validator::ValidationError& error) override;

 private:
  std::ostream& out_;
  bool first_{true};
};

}  // namespace redline::sink
