#include "core/json_dom.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

namespace json = fourree::core::json;

namespace {

json::Value ParseOrFail(const std::string& text) {
  json::Value root;
  std::string error;
  const bool ok = json::Parse(text, root, error);
  INFO(error);
  REQUIRE(ok);
  return root;
}

std::string ParseError(const std::string& text) {
  json::Value root;
  std::string error;
  REQUIRE_FALSE(json::Parse(text, root, error));
  return error;
}

} // namespace

TEST_CASE("Parser builds nested objects and arrays", "[core][json]") {
  const json::Value root = ParseOrFail(
      R"({"table_name":"t","fields":[{"n":1},{"n":-2.5}],"flag":true,"none":null})");

  REQUIRE(root.type == json::Value::Type::kObject);
  const json::Value* name = json::Find(root, "table_name");
  REQUIRE(name != nullptr);
  REQUIRE(name->string_value == "t");

  const json::Value* fields = json::Find(root, "fields");
  REQUIRE(fields != nullptr);
  REQUIRE(fields->type == json::Value::Type::kArray);
  REQUIRE(fields->array_value.size() == 2U);
  REQUIRE(json::Find(fields->array_value[1], "n")->number_value == -2.5);

  REQUIRE(json::Find(root, "flag")->bool_value);
  REQUIRE(json::Find(root, "none")->type == json::Value::Type::kNull);
  REQUIRE(json::Find(root, "missing") == nullptr);
  REQUIRE(json::Find(*fields, "n") == nullptr);
}

TEST_CASE("Integer reads are exact across the signed 64-bit range", "[core][json]") {
  const json::Value root = ParseOrFail(
      R"({"max":9223372036854775807,"min":-9223372036854775808,"over":9223372036854775808,)"
      R"("exp":1e3,"frac":5.5,"whole":5.0,"text":"7"})");

  std::int64_t value = 0;
  REQUIRE(json::TryGetInt64(*json::Find(root, "max"), value));
  REQUIRE(value == INT64_MAX);
  REQUIRE(json::TryGetInt64(*json::Find(root, "min"), value));
  REQUIRE(value == INT64_MIN);
  REQUIRE_FALSE(json::TryGetInt64(*json::Find(root, "over"), value));

  REQUIRE(json::TryGetInt64(*json::Find(root, "exp"), value));
  REQUIRE(value == 1000);
  REQUIRE(json::TryGetInt64(*json::Find(root, "whole"), value));
  REQUIRE(value == 5);
  REQUIRE_FALSE(json::TryGetInt64(*json::Find(root, "frac"), value));
  REQUIRE_FALSE(json::TryGetInt64(*json::Find(root, "text"), value));

  std::uint64_t count = 0;
  REQUIRE_FALSE(json::TryGetNonNegativeInteger(*json::Find(root, "min"), count));
  REQUIRE(json::TryGetNonNegativeInteger(*json::Find(root, "exp"), count));
  REQUIRE(count == 1000U);
}

TEST_CASE("Unicode escapes decode to UTF-8", "[core][json]") {
  const json::Value root = ParseOrFail(R"({"a":"caf\u00e9","b":"\ud83d\ude00","c":"tab\there"})");
  REQUIRE(json::Find(root, "a")->string_value == "caf\xC3\xA9");
  REQUIRE(json::Find(root, "b")->string_value == "\xF0\x9F\x98\x80");
  REQUIRE(json::Find(root, "c")->string_value == "tab\there");

  REQUIRE(ParseError(R"({"a":"\ude00"})").find("unpaired low surrogate") != std::string::npos);
  REQUIRE(ParseError(R"({"a":"\ud83d"})").find("unpaired high surrogate") != std::string::npos);
}

TEST_CASE("Malformed documents report line and column", "[core][json]") {
  const std::string trailing = ParseError("{\"a\":1}\n  x");
  REQUIRE(trailing.find("line 2") != std::string::npos);
  REQUIRE(trailing.find("trailing content") != std::string::npos);

  REQUIRE(ParseError(R"({"a":1,"a":2})").find("duplicate object key 'a'") != std::string::npos);
  REQUIRE(ParseError(R"({"a":)").find("unexpected end of input") != std::string::npos);
  REQUIRE(ParseError("{\"a\":\"line\nbreak\"}").find("control character") != std::string::npos);
}

TEST_CASE("Underflowing numbers parse as tiny finite values", "[core][json]") {
  const json::Value root = ParseOrFail(R"({"subnormal": 1e-310, "gone": 1e-400, "neg": -2.5e-320})");

  const json::Value* subnormal = json::Find(root, "subnormal");
  REQUIRE(subnormal != nullptr);
  REQUIRE(subnormal->number_value > 0.0);
  REQUIRE(subnormal->number_value < 1e-300);
  REQUIRE(subnormal->number_text == "1e-310");

  const json::Value* gone = json::Find(root, "gone");
  REQUIRE(gone != nullptr);
  REQUIRE(gone->number_value == 0.0);

  const json::Value* neg = json::Find(root, "neg");
  REQUIRE(neg != nullptr);
  REQUIRE(neg->number_value <= 0.0);
}

TEST_CASE("Overflowing numbers are rejected", "[core][json]") {
  REQUIRE(ParseError(R"({"big": 1e400})").find("numeric value out of range") != std::string::npos);
  REQUIRE(ParseError(R"({"big": -1e400})").find("numeric value out of range") != std::string::npos);
}

TEST_CASE("Nesting depth is bounded", "[core][json]") {
  const std::string ok_depth = std::string(64, '[') + std::string(64, ']');
  ParseOrFail(ok_depth);

  const std::string too_deep = std::string(65, '[') + std::string(65, ']');
  REQUIRE(ParseError(too_deep).find("maximum nesting depth exceeded") != std::string::npos);
}
