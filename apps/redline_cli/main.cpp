#include "redline/app/check_pipeline.h"
#include "redline/config/configuration_loader.h"
#include "redline/core/version.h"
#include "redline/sink/composite_result_sink.h"
#include "redline/sink/json_result_sink.h"
#include "redline/sink/plain_result_sink.h"
#include "redline/sink/sqlite_result_sink.h"
#include "redline/storage/sqlite/sqlite_db.h"

#include "shared/arg_parser.h"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr int kExitClean = 0;
constexpr int kExitFindings = 1;
constexpr int kExitUsage = 2;

struct CliConfig {
  std::optional<std::string> conf_path;
  std::string format{"plain"};
  std::string parser{"plain"};
  std::optional<std::string> db_path;
  bool help{false};
};

const std::vector<redline::apps::Option<CliConfig>>& cli_options() {
  static const std::vector<redline::apps::Option<CliConfig>> options = {
      {"--conf", true, "Path to the JSON configuration (required)",
       [](CliConfig& c, const std::string& v) {
         c.conf_path = v;
         return true;
       }},
      {"--format", true, "Output format (plain|json, default plain)",
       [](CliConfig& c, const std::string& v) {
         if (v == "plain" || v == "json") {
           c.format = v;
           return true;
         }
         return false;
       }},
      {"--parser", true, "Input parser (plain|markdown, default plain)",
       [](CliConfig& c, const std::string& v) {
         c.parser = v;
         return true;
       }},
      {"--db", true, "Also persist findings to this SQLite database",
       [](CliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--help", false, "Show this help",
       [](CliConfig& c, const std::string& /*v*/) {
         c.help = true;
         return true;
       }},
  };
  return options;
}

void print_usage(std::ostream& out) {
  out << "redline " << redline::core::kBuildVersion << "\n"
      << "Usage: redline_cli --conf <config.json> [options] <files...>\n";
  redline::apps::print_options(out, cli_options());
}

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto args = redline::apps::parse_options(argc, argv, cli_options());

  if (args.config.help) {
    print_usage(std::cout);
    return kExitClean;
  }
  if (!args.ok()) {
    for (const auto& error : args.errors) {
      std::cerr << error << "\n";
    }
    print_usage(std::cerr);
    return kExitUsage;
  }
  if (!args.config.conf_path.has_value() || args.positional.empty()) {
    print_usage(std::cerr);
    return kExitUsage;
  }

  auto configuration = redline::config::load_configuration(args.config.conf_path.value());
  if (!configuration.has_value()) {
    std::cerr << "Failed to load configuration: " << configuration.error() << "\n";
    return kExitUsage;
  }

  auto sources = redline::app::load_sources(args.positional);
  if (!sources.has_value()) {
    std::cerr << "Failed to read input: " << sources.error() << "\n";
    return kExitUsage;
  }

  std::vector<std::shared_ptr<redline::sink::IResultSink>> sinks;
  if (args.config.format == "json") {
    sinks.push_back(std::make_shared<redline::sink::JsonResultSink>(std::cout));
  } else {
    sinks.push_back(std::make_shared<redline::sink::PlainResultSink>(std::cout));
  }

  if (args.config.db_path.has_value()) {
    auto db_result = redline::storage::sqlite::SqliteDb::open(args.config.db_path.value());
    if (!db_result.has_value()) {
      std::cerr << "Failed to open database: " << db_result.error() << "\n";
      return kExitUsage;
    }

    auto db = db_result.value();
    auto schema_result = db->ensure_schema_v1();
    if (!schema_result.has_value()) {
      std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
      return kExitUsage;
    }
    sinks.push_back(std::make_shared<redline::sink::SqliteResultSink>(db, std::cerr));
  }

  redline::app::CheckRequest request{std::move(configuration.value()),
                                     std::move(sources.value()), args.config.parser};
  auto sink = std::make_shared<redline::sink::CompositeResultSink>(std::move(sinks));

  auto response = redline::app::run_check_pipeline(request, sink, std::cerr);
  if (!response.has_value()) {
    std::cerr << "Error: " << response.error() << "\n";
    return kExitUsage;
  }

  return response.value().findings == 0 ? kExitClean : kExitFindings;
}
