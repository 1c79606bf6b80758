#include "fourree/cli/router.hpp"

#include "artifacts/run_summary_writer.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "schema/model.hpp"
#include "schema/validator.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <random>
#include <system_error>

namespace fs = std::filesystem;

namespace fourree::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitSchemaInvalid = core::errors::ToInt(core::errors::ExitCode::kSchemaInvalid);
constexpr int kExitOutputUnsupported =
    core::errors::ToInt(core::errors::ExitCode::kOutputUnsupported);

// A command-line option after name normalization. `name` is the long name
// without leading dashes and with `_` folded to `-`; `spelled` is what the
// user typed, for error messages.
struct OptionToken {
  std::string name;
  std::string spelled;
  std::optional<std::string> inline_value;
};

bool IsHelpToken(std::string_view token) {
  return token == "-h" || token == "--help";
}

bool ResolveShortOption(char letter, std::string& name) {
  switch (letter) {
  case 'h':
    name = "help";
    return true;
  case 'V':
    name = "version";
    return true;
  case 'n':
    name = "num-rows";
    return true;
  case 'b':
    name = "batch-size";
    return true;
  case 't':
    name = "threads";
    return true;
  case 'o':
    name = "output";
    return true;
  case 'f':
    name = "output-file";
    return true;
  case 'l':
    name = "log-file";
    return true;
  case 'd':
    name = "delimiter";
    return true;
  default:
    return false;
  }
}

bool ResolveOptionToken(std::string_view token, OptionToken& option, std::string& error) {
  option = OptionToken{};
  if (token.size() > 2 && token.substr(0, 2) == "--") {
    std::string_view body = token.substr(2);
    const std::size_t equals = body.find('=');
    if (equals != std::string_view::npos) {
      option.inline_value = std::string(body.substr(equals + 1));
      body = body.substr(0, equals);
    }
    option.spelled = "--" + std::string(body);
    option.name = std::string(body);
    std::replace(option.name.begin(), option.name.end(), '_', '-');
    return true;
  }

  if (token.size() == 2 && token.front() == '-' && ResolveShortOption(token[1], option.name)) {
    option.spelled = std::string(token);
    return true;
  }

  error = "unknown option: " + std::string(token);
  return false;
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& index,
               const OptionToken& option, std::string& value, std::string& error) {
  if (option.inline_value.has_value()) {
    value = option.inline_value.value();
    return true;
  }
  if (index + 1 >= args.size()) {
    error = "missing value for " + option.spelled;
    return false;
  }
  ++index;
  value = std::string(args[index]);
  return true;
}

bool RejectInlineValue(const OptionToken& option, std::string& error) {
  if (option.inline_value.has_value()) {
    error = option.spelled + " does not take a value";
    return false;
  }
  return true;
}

bool ParseUnsigned(std::string_view text, const OptionToken& option, std::uint64_t& value,
                   std::string& error) {
  std::uint64_t parsed = 0;
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (text.empty() || ec != std::errc() || ptr != end) {
    error = "invalid value for " + option.spelled + ": '" + std::string(text) +
            "' (expected a non-negative integer)";
    return false;
  }
  value = parsed;
  return true;
}

// `\t` typed literally on a shell command line arrives as two characters.
std::string UnescapeDelimiter(std::string_view raw) {
  if (raw == "\\t") {
    return "\t";
  }
  return std::string(raw);
}

// Filesystem preflight before validation, so a missing file is reported as an
// I/O failure rather than a schema issue.
bool ValidateSchemaPath(const std::string& schema_path, std::string& error) {
  if (schema_path.empty()) {
    error = "schema path cannot be empty";
    return false;
  }

  const fs::path path(schema_path);
  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    error = "schema file not found: " + schema_path;
    return false;
  }
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "schema path must point to a regular file: " + schema_path;
    return false;
  }

  return true;
}

std::uint64_t RandomSeed() {
  try {
    std::random_device device;
    return (static_cast<std::uint64_t>(device()) << 32U) ^ static_cast<std::uint64_t>(device());
  } catch (const std::exception&) {
    // No entropy source available; the clock still gives a fresh seed per run.
    return static_cast<std::uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
  }
}

} // namespace

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  fourree FILE [options]\n"
      << "  fourree -h | --help\n"
      << "  fourree -V | --version\n"
      << "\n"
      << "Generates fake rows for the table described by the JSON schema in FILE.\n"
      << "\n"
      << "options:\n"
      << "  -n, --num_rows <N>          rows to generate (default "
      << generation::kDefaultNumRows << ")\n"
      << "  -b, --batch_size <N>        rows per batch, > 0 (default "
      << generation::kDefaultBatchSize << ")\n"
      << "  -t, --threads <N>           worker threads, 1-" << generation::kMaxThreads
      << " (default " << generation::kDefaultThreads << ")\n"
      << "  -o, --output <MODE>         " << output::ExpectedOutputModeList()
      << " (default stdout)\n"
      << "  -f, --output_file <PATH>    file path for file output, bucket:key for s3\n"
      << "  -l, --log_file <PATH>       write log lines to PATH instead of stderr\n"
      << "      --log-level <LEVEL>     " << core::logging::ExpectedLogLevelList()
      << " (default info)\n"
      << "  -d, --delimiter <STR>       field delimiter, \\t accepted (default TAB)\n"
      << "      --header                emit a header row with the field names\n"
      << "      --seed <N>              base random seed (default: random, logged)\n"
      << "      --summary <PATH>        write a JSON run summary to PATH\n"
      << "      --validate              validate FILE and exit\n"
      << "  -h, --help                  print this help and exit\n"
      << "  -V, --version               print the version and exit\n"
      << "\n"
      << "exit codes: 0 success, 1 failure, 2 usage error, 10 invalid schema,\n"
      << "            20 output mode not available\n";
}

bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::vector<std::string>& warnings, std::string& error) {
  if (std::any_of(args.begin(), args.end(), IsHelpToken)) {
    options.show_help = true;
    return true;
  }

  bool output_file_given = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token.empty() || token.front() != '-' || token == "-") {
      if (!options.schema_path.empty()) {
        error = "fourree accepts exactly 1 schema file (got '" + options.schema_path +
                "' and '" + std::string(token) + "')";
        return false;
      }
      options.schema_path = std::string(token);
      continue;
    }

    OptionToken option;
    if (!ResolveOptionToken(token, option, error)) {
      return false;
    }

    std::string value;
    if (option.name == "version") {
      if (!RejectInlineValue(option, error)) {
        return false;
      }
      options.show_version = true;
      continue;
    }
    if (option.name == "header") {
      if (!RejectInlineValue(option, error)) {
        return false;
      }
      options.header = true;
      continue;
    }
    if (option.name == "validate") {
      if (!RejectInlineValue(option, error)) {
        return false;
      }
      options.validate_only = true;
      continue;
    }
    if (option.name == "num-rows") {
      if (!TakeValue(args, i, option, value, error) ||
          !ParseUnsigned(value, option, options.num_rows, error)) {
        return false;
      }
      continue;
    }
    if (option.name == "batch-size") {
      if (!TakeValue(args, i, option, value, error) ||
          !ParseUnsigned(value, option, options.batch_size, error)) {
        return false;
      }
      if (options.batch_size == 0U) {
        error = option.spelled + " must be greater than 0";
        return false;
      }
      continue;
    }
    if (option.name == "threads") {
      std::uint64_t threads = 0;
      if (!TakeValue(args, i, option, value, error) ||
          !ParseUnsigned(value, option, threads, error)) {
        return false;
      }
      if (threads == 0U) {
        error = option.spelled + " must be greater than 0";
        return false;
      }
      if (threads > generation::kMaxThreads) {
        warnings.push_back("threads " + std::to_string(threads) + " exceeds the maximum; using " +
                           std::to_string(generation::kMaxThreads));
        threads = generation::kMaxThreads;
      }
      options.num_threads = static_cast<std::uint32_t>(threads);
      continue;
    }
    if (option.name == "output") {
      if (!TakeValue(args, i, option, value, error) ||
          !output::ParseOutputMode(value, options.output_mode, error)) {
        return false;
      }
      continue;
    }
    if (option.name == "output-file") {
      if (!TakeValue(args, i, option, options.output_file, error)) {
        return false;
      }
      output_file_given = true;
      continue;
    }
    if (option.name == "log-file") {
      if (!TakeValue(args, i, option, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = option.spelled + " cannot be empty";
        return false;
      }
      options.log_file = value;
      continue;
    }
    if (option.name == "log-level") {
      if (!TakeValue(args, i, option, value, error) ||
          !core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }
    if (option.name == "delimiter") {
      if (!TakeValue(args, i, option, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = option.spelled + " cannot be empty";
        return false;
      }
      options.delimiter = UnescapeDelimiter(value);
      continue;
    }
    if (option.name == "seed") {
      std::uint64_t seed = 0;
      if (!TakeValue(args, i, option, value, error) ||
          !ParseUnsigned(value, option, seed, error)) {
        return false;
      }
      options.seed = seed;
      continue;
    }
    if (option.name == "summary") {
      if (!TakeValue(args, i, option, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = option.spelled + " cannot be empty";
        return false;
      }
      options.summary_path = value;
      continue;
    }

    error = "unknown option: " + option.spelled;
    return false;
  }

  if (options.show_version) {
    return true;
  }

  if (options.schema_path.empty()) {
    error = "missing required argument: FILE (the table schema JSON)";
    return false;
  }

  switch (options.output_mode) {
  case output::OutputMode::kFile:
    if (options.output_file.empty()) {
      error = "--output_file is required when output is file";
      return false;
    }
    break;
  case output::OutputMode::kS3: {
    output::S3Location location;
    if (!output::ParseS3Location(options.output_file, location, error)) {
      return false;
    }
    break;
  }
  case output::OutputMode::kStdout:
  case output::OutputMode::kPostgreSql:
    if (output_file_given) {
      warnings.push_back(std::string("--output_file is ignored when output is ") +
                         output::ToString(options.output_mode));
    }
    break;
  }

  return true;
}

int ExecuteRun(const RunOptions& options, const std::vector<std::string>& warnings) {
  std::string error;

  std::ofstream log_file;
  std::ostream* log_out = &std::cerr;
  if (!options.log_file.empty()) {
    if (!core::EnsureParentDirectory(options.log_file, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    log_file.open(options.log_file, std::ios::binary | std::ios::trunc);
    if (!log_file) {
      std::cerr << "error: failed to open log file '" << options.log_file.string() << "'\n";
      return kExitFailure;
    }
    log_out = &log_file;
  }
  core::logging::Logger logger(options.log_level, *log_out);

  for (const auto& warning : warnings) {
    logger.Warn("option adjusted", {{"detail", warning}});
  }

  logger.Info("run requested",
              {{"schema_path", options.schema_path},
               {"output", output::ToString(options.output_mode)},
               {"validate_only", options.validate_only ? "true" : "false"}});

  if (!ValidateSchemaPath(options.schema_path, error)) {
    logger.Error("schema path rejected", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  schema::Schema table;
  schema::ValidationReport report;
  if (!schema::LoadSchemaFile(options.schema_path, table, report, error)) {
    logger.Error("schema load failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  for (const auto& warning : report.warnings) {
    logger.Warn("schema warning", {{"path", warning.path}, {"detail", warning.message}});
  }
  if (!report.valid) {
    logger.Error("schema validation failed",
                 {{"schema_path", options.schema_path},
                  {"issues", std::to_string(report.issues.size())}});
    std::cerr << "invalid schema: " << options.schema_path << '\n';
    for (const auto& issue : report.issues) {
      std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
    }
    return kExitSchemaInvalid;
  }

  if (options.validate_only) {
    std::cout << "valid: " << options.schema_path << '\n';
    return kExitSuccess;
  }

  std::unique_ptr<output::IOutputSink> sink =
      output::CreateOutputSink(options.output_mode, options.output_file, error);
  if (sink == nullptr) {
    logger.Error("output unavailable",
                 {{"output", output::ToString(options.output_mode)}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return output::IsOutputModeImplemented(options.output_mode) ? kExitFailure
                                                                : kExitOutputUnsupported;
  }

  logger.SetTableName(table.table_name);
  for (const auto& field : table.fields) {
    logger.Debug("field loaded", {{"name", field.name},
                                  {"data_type", field.data_type},
                                  {"generator", schema::ToString(field.kind)}});
  }

  const std::uint64_t seed = options.seed.has_value() ? options.seed.value() : RandomSeed();
  logger.Info("run configured",
              {{"fields", std::to_string(table.fields.size())},
               {"target", sink->Describe()},
               {"seed", std::to_string(seed)},
               {"seed_source", options.seed.has_value() ? "option" : "random"}});

  const auto started_at = std::chrono::system_clock::now();
  if (!sink->Open(error)) {
    logger.Error("output open failed", {{"target", sink->Describe()}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  generation::GenerationPlan plan;
  plan.num_rows = options.num_rows;
  plan.batch_size = options.batch_size;
  plan.num_threads = options.num_threads;
  plan.seed = seed;
  plan.delimiter = options.delimiter;
  plan.include_header = options.header;

  generation::GenerationResult result;
  if (!generation::GenerateData(table, plan, *sink, logger, result, error)) {
    logger.Error("generation failed",
                 {{"error", error}, {"rows_written", std::to_string(result.rows_written)}});
    std::cerr << "error: generation failed: " << error << '\n';
    return kExitFailure;
  }

  if (!sink->Close(error)) {
    logger.Error("output close failed", {{"target", sink->Describe()}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  const auto finished_at = std::chrono::system_clock::now();

  if (!options.summary_path.empty()) {
    artifacts::GenerationSummary summary;
    summary.table_name = table.table_name;
    summary.output_mode = output::ToString(options.output_mode);
    summary.output_target = sink->Describe();
    summary.num_rows = options.num_rows;
    summary.batch_size = options.batch_size;
    summary.num_threads = options.num_threads;
    summary.seed = seed;
    summary.rows_written = result.rows_written;
    summary.batches_written = result.batches_written;
    summary.bytes_written = result.bytes_written;
    summary.header_written = result.header_written;
    summary.elapsed = result.elapsed;
    summary.started_at = started_at;
    summary.finished_at = finished_at;
    if (!artifacts::WriteGenerationSummaryJson(summary, options.summary_path, error)) {
      logger.Error("summary write failed", {{"error", error}});
      std::cerr << "error: failed to write summary: " << error << '\n';
      return kExitFailure;
    }
    logger.Info("summary written", {{"path", options.summary_path.string()}});
  }

  // Stdout carries the rows themselves in stdout mode, so the report lines are
  // only printed when the data went elsewhere.
  if (options.output_mode != output::OutputMode::kStdout) {
    std::cout << "output: " << sink->Describe() << '\n';
    std::cout << "rows_written: " << result.rows_written << '\n';
    if (!options.summary_path.empty()) {
      std::cout << "summary: " << options.summary_path.string() << '\n';
    }
  }

  logger.Info("run completed", {{"elapsed_ms", std::to_string(result.elapsed.count())}});
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  const std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  if (args.empty()) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  RunOptions options;
  std::vector<std::string> warnings;
  std::string error;
  if (!ParseRunOptions(args, options, warnings, error)) {
    std::cerr << "error: " << error << '\n';
    std::cerr << "run 'fourree --help' for usage\n";
    return kExitUsage;
  }

  if (options.show_help) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  if (options.show_version) {
    std::cout << "fourree " << kVersion << '\n';
    return kExitSuccess;
  }

  return ExecuteRun(options, warnings);
}

} // namespace fourree::cli
