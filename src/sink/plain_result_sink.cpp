#include "redline/sink/plain_result_sink.h"

namespace redline::sink {

void PlainResultSink::flush_footer() { out_.flush(); }

SinkResult PlainResultSink::flush_error(const domain::Document& document,
                                        const validator::ValidationError& error) {
  if (!out_) {
    return SinkResult::err(SinkError{"output stream is in a failed state"});
  }

  out_ << document.file_name.value_or("<input>") << ':' << error.line_number << ": "
       << validator::describe(error) << '\n';

  if (!out_) {
    return SinkResult::err(SinkError{"failed to write finding"});
  }
  return SinkResult::ok(true);
}

}  // namespace redline::sink
