#pragma once

#include "redline/core/result.h"
#include "redline/domain/document.h"
#include "redline/validator/validation_error.h"

#include <string>

namespace redline::sink {

struct SinkError {
  std::string message;
};

using SinkResult = core::Result<bool, SinkError>;

// IResultSink receives the findings of a run as they are produced.
//
// flush_header / flush_footer bracket one ValidationEngine::validate call.
// flush_error reports failure through its result; the engine logs the failure
// and keeps going, so an implementation must not rely on a failed call
// stopping the run.
class IResultSink {
 public:
  virtual ~IResultSink() = default;

  virtual void flush_header() = 0;
  virtual void flush_footer() = 0;
  [[nodiscard]] virtual SinkResult flush_error(const domain::Document& document,
                                               const validator::ValidationError& error) = 0;
};

// NullResultSink accepts and discards everything.
class NullResultSink final : public IResultSink {
 public:
  void flush_header() override {}
  void flush_footer() override {}
  [[nodiscard]] SinkResult flush_error(const domain::Document& /*document*/,
                                       const validator::ValidationError& /*error*/) override {
    return SinkResult::ok(true);
  }
};

}  // namespace redline::sink
