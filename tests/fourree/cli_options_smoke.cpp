#include "fourree/cli/router.hpp"

#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using fourree::tests::common::AssertContains;
using fourree::tests::common::Fail;

namespace {

namespace cli = fourree::cli;

cli::RunOptions ParseOrFail(const std::vector<std::string_view>& args,
                            std::vector<std::string>* warnings_out = nullptr) {
  cli::RunOptions options;
  std::vector<std::string> warnings;
  std::string error;
  if (!cli::ParseRunOptions(args, options, warnings, error)) {
    Fail("ParseRunOptions failed unexpectedly: " + error);
  }
  if (warnings_out != nullptr) {
    *warnings_out = warnings;
  }
  return options;
}

std::string ParseError(const std::vector<std::string_view>& args) {
  cli::RunOptions options;
  std::vector<std::string> warnings;
  std::string error;
  if (cli::ParseRunOptions(args, options, warnings, error)) {
    Fail("ParseRunOptions accepted invalid arguments");
  }
  return error;
}

} // namespace

int main() {
  {
    const cli::RunOptions options = ParseOrFail({"schema.json"});
    if (options.schema_path != "schema.json" || options.num_rows != 1000U ||
        options.batch_size != 100U || options.num_threads != 1U ||
        options.output_mode != fourree::output::OutputMode::kStdout ||
        options.delimiter != "\t" || options.header || options.seed.has_value() ||
        options.log_level != fourree::core::logging::LogLevel::kInfo) {
      Fail("defaults do not match the documented values");
    }
    if (options.delimiter != fourree::generation::GenerationPlan{}.delimiter) {
      Fail("CLI and pipeline must share the default delimiter");
    }
  }

  {
    const cli::RunOptions options =
        ParseOrFail({"-n", "25", "-b", "5", "-t", "4", "-o", "file", "-f", "out.tsv", "-l",
                     "run.log", "-d", ",", "schema.json"});
    if (options.num_rows != 25U || options.batch_size != 5U || options.num_threads != 4U ||
        options.output_mode != fourree::output::OutputMode::kFile ||
        options.output_file != "out.tsv" || options.log_file != "run.log" ||
        options.delimiter != ",") {
      Fail("short options not applied");
    }
  }

  {
    const cli::RunOptions options = ParseOrFail(
        {"schema.json", "--num_rows=7", "--batch-size", "3", "--threads=2", "--output=FILE",
         "--output-file=rows.tsv", "--log_level", "debug", "--delimiter=\\t", "--header",
         "--seed", "99", "--summary=run.json", "--validate"});
    if (options.num_rows != 7U || options.batch_size != 3U || options.num_threads != 2U ||
        options.output_file != "rows.tsv" ||
        options.log_level != fourree::core::logging::LogLevel::kDebug ||
        options.delimiter != "\t" || !options.header || options.seed != 99U ||
        options.summary_path != "run.json" || !options.validate_only) {
      Fail("long options with '=' and '_'/'-' spellings not applied");
    }
  }

  {
    std::vector<std::string> warnings;
    const cli::RunOptions options = ParseOrFail({"schema.json", "-t", "500"}, &warnings);
    if (options.num_threads != fourree::generation::kMaxThreads || warnings.size() != 1U) {
      Fail("threads above the maximum should clamp with a warning");
    }
    AssertContains(warnings.front(), "using 128");

    ParseOrFail({"schema.json", "-f", "ignored.tsv"}, &warnings);
    if (warnings.size() != 1U) {
      Fail("--output_file with stdout output should warn");
    }
  }

  {
    const cli::RunOptions options = ParseOrFail({"--version"});
    if (!options.show_version) {
      Fail("--version should not require a schema file");
    }
    if (!ParseOrFail({"-x", "-h"}).show_help) {
      Fail("-h should win over unknown options");
    }
  }

  AssertContains(ParseError({}), "missing required argument: FILE");
  AssertContains(ParseError({"a.json", "b.json"}), "exactly 1 schema file");
  AssertContains(ParseError({"a.json", "--bogus"}), "unknown option: --bogus");
  AssertContains(ParseError({"a.json", "-z"}), "unknown option: -z");
  AssertContains(ParseError({"a.json", "-n"}), "missing value for -n");
  AssertContains(ParseError({"a.json", "-n", "-5"}), "expected a non-negative integer");
  AssertContains(ParseError({"a.json", "--num_rows=12abc"}), "invalid value for --num_rows");
  AssertContains(ParseError({"a.json", "-b", "0"}), "must be greater than 0");
  AssertContains(ParseError({"a.json", "-t", "0"}), "must be greater than 0");
  AssertContains(ParseError({"a.json", "--header=yes"}), "does not take a value");
  AssertContains(ParseError({"a.json", "-o", "kafka"}), "unsupported output 'kafka'");
  AssertContains(ParseError({"a.json", "-o", "file"}), "--output_file is required");
  AssertContains(ParseError({"a.json", "-o", "s3", "-f", "no-colon"}), "bucket:path");
  AssertContains(ParseError({"a.json", "--log-level", "loud"}), "invalid --log-level");
  AssertContains(ParseError({"a.json", "-d", ""}), "cannot be empty");

  {
    const auto run = fourree::tests::common::DispatchCaptured({"fourree", "a.json", "-t", "x"});
    fourree::tests::common::AssertExitCode(run.exit_code, 2, "invalid thread count");
    AssertContains(run.stderr_text, "error: invalid value for -t");
    AssertContains(run.stderr_text, "fourree --help");
    if (!run.stdout_text.empty()) {
      Fail("usage errors must not write to stdout");
    }
  }

  std::cout << "cli_options_smoke: ok\n";
  return 0;
}
