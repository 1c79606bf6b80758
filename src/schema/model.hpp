#pragma once

#include "schema/validator.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fourree::schema {

constexpr int kDefaultDateMinYear = 1900;
constexpr int kDefaultDateMaxYear = 2016;
constexpr int kMinSupportedYear = 1;
constexpr int kMaxSupportedYear = 9999;

// Value generator attached to a field. `kNone` covers generator names this
// build does not know; such fields render the literal `None`.
enum class GeneratorKind {
  kNone,
  kInteger,
  kGauss,
  kGaussFloat,
  kString,
  kDate,
  kChoice,
};

enum class CharacterSet {
  kUpper,
  kLower,
  kAlpha,
  kAlphanumeric,
  kDigits,
};

struct IntegerSpec {
  std::int64_t min = 0;
  std::int64_t max = 0;
};

struct GaussSpec {
  double mean = 0.0;
  double std_dev = 0.0;
};

struct StringSpec {
  std::size_t length = 0;
  CharacterSet charset = CharacterSet::kUpper;
};

struct DateSpec {
  int min_year = kDefaultDateMinYear;
  int max_year = kDefaultDateMaxYear;
};

struct ChoiceSpec {
  std::vector<std::string> choices;
};

// One output column. Only the parameter block matching `kind` carries meaning; the
// others keep their defaults.
struct Field {
  std::string name;
  std::string data_type;
  std::string generator_name;
  GeneratorKind kind = GeneratorKind::kNone;

  IntegerSpec integer;
  GaussSpec gauss;
  StringSpec string;
  DateSpec date;
  ChoiceSpec choice;
};

struct Schema {
  std::string table_name;
  std::vector<Field> fields;

  void AddField(Field field) {
    fields.push_back(std::move(field));
  }
};

GeneratorKind GeneratorKindFromName(std::string_view name);
const char* ToString(GeneratorKind kind);

bool ParseCharacterSet(std::string_view name, CharacterSet& charset);
const char* ToString(CharacterSet charset);
std::string_view AlphabetFor(CharacterSet charset);

// Parses `json_text` once, validates the document into `report` and, when the
// report is valid, builds `schema`.
//
// Contract:
// - Returns true when validation completed; check `report.valid` before using
//   `schema`, which is left untouched for invalid documents.
// - JSON syntax errors become one issue under path `$`.
bool ParseSchemaText(std::string_view json_text, Schema& schema, ValidationReport& report,
                     std::string& error);

// Reads `schema_path` once and runs the overload above on its contents.
// Returns false with `error` set only when the file cannot be read.
bool LoadSchemaFile(const std::filesystem::path& schema_path, Schema& schema,
                    ValidationReport& report, std::string& error);

// Parses schema JSON text into a Schema.
//
// Contract:
// - Runs the full validator first; on an invalid document returns false with
//   `error` naming the first issue as `<path>: <message>`.
// - `schema` is only modified on success.
bool ParseSchemaText(std::string_view json_text, Schema& schema, std::string& error);

// Reads and parses a schema file (see ParseSchemaText).
bool LoadSchemaFile(const std::filesystem::path& schema_path, Schema& schema, std::string& error);

} // namespace fourree::schema
