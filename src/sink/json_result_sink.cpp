#include "redline/sink/json_result_sink.h"

namespace redline::sink {

nlohmann::json to_json(const domain::Document& document, const validator::ValidationError& error) {
  nlohmann::json j;
  j["file"] = document.file_name ? nlohmann::json(*document.file_name) : nlohmann::json(nullptr);
  j["validator"] = error.validator_name;
  j["message"] = error.message;
  j["sentence"] = error.sentence;
  j["line"] = error.line_number;
  j["start_position"] =
      error.start_position ? nlohmann::json(*error.start_position) : nlohmann::json(nullptr);
  j["end_position"] =
      error.end_position ? nlohmann::json(*error.end_position) : nlohmann::json(nullptr);
  return j;
}

void JsonResultSink::flush_header() {
  first_ = true;
  out_ << '[';
}

void JsonResultSink::flush_footer() {
  out_ << (first_ ? "]" : "\n]") << '\n';
  out_.flush();
}

SinkResult JsonResultSink::flush_error(const domain::Document& document,
                                       const validator::ValidationError& error) {
  if (!out_) {
    return SinkResult::err(SinkError{"output stream is in a failed state"});
  }

  out_ << (first_ ? "\n  " : ",\n  ") << to_json(document, error).dump();
  if (!out_) {
    return SinkResult::err(SinkError{"failed to write finding"});
  }
  first_ = false;
  return SinkResult::ok(true);
}

}  // namespace redline::sink
