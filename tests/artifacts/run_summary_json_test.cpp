#include "artifacts/run_summary_writer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

namespace {

void RequireContains(const std::string& text, const std::string& needle) {
  INFO(text);
  REQUIRE(text.find(needle) != std::string::npos);
}

} // namespace

TEST_CASE("Generation summary JSON carries every run field", "[artifacts][summary][json]") {
  fourree::artifacts::GenerationSummary summary;
  summary.table_name = "people \"v2\"";
  summary.output_mode = "file";
  summary.output_target = "out/people.tsv";
  summary.num_rows = 250;
  summary.batch_size = 100;
  summary.num_threads = 4;
  summary.seed = 18446744073709551615ULL;
  summary.rows_written = 250;
  summary.batches_written = 3;
  summary.bytes_written = 9001;
  summary.header_written = true;
  summary.elapsed = std::chrono::milliseconds(12);
  summary.started_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'000));
  summary.finished_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(2'500));

  const std::string json = fourree::artifacts::ToJson(summary);
  RequireContains(json, "\"table_name\":\"people \\\"v2\\\"\"");
  RequireContains(json, "\"output_mode\":\"file\"");
  RequireContains(json, "\"output_target\":\"out/people.tsv\"");
  RequireContains(json, "\"num_rows\":250");
  RequireContains(json, "\"batch_size\":100");
  RequireContains(json, "\"num_threads\":4");
  RequireContains(json, "\"seed\":18446744073709551615");
  RequireContains(json, "\"rows_written\":250");
  RequireContains(json, "\"batches_written\":3");
  RequireContains(json, "\"bytes_written\":9001");
  RequireContains(json, "\"header_written\":true");
  RequireContains(json, "\"elapsed_ms\":12");
  RequireContains(json, "\"started_at_utc\":\"1970-01-01T00:00:01.000Z\"");
  RequireContains(json, "\"finished_at_utc\":\"1970-01-01T00:00:02.500Z\"");
  REQUIRE(json.front() == '{');
  REQUIRE(json.back() == '}');
}

TEST_CASE("Summary strings escape control characters", "[artifacts][summary][json]") {
  fourree::artifacts::GenerationSummary summary;
  summary.table_name = "tab\there";
  summary.output_target = std::string("a\x01" "b\\c");

  const std::string json = fourree::artifacts::ToJson(summary);
  RequireContains(json, "\"table_name\":\"tab\\there\"");
  RequireContains(json, "\"output_target\":\"a\\u0001b\\\\c\"");
}

TEST_CASE("Summary timestamps before the epoch keep positive milliseconds",
          "[artifacts][summary][json]") {
  fourree::artifacts::GenerationSummary summary;
  summary.started_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(-1'500));

  RequireContains(fourree::artifacts::ToJson(summary),
                  "\"started_at_utc\":\"1969-12-31T23:59:58.500Z\"");
}
