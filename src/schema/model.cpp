#include "schema/model.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "schema/validator.hpp"

#include <utility>

namespace fs = std::filesystem;

namespace fourree::schema {

namespace {

using JsonValue = core::json::Value;

constexpr std::string_view kUpperAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr std::string_view kLowerAlphabet = "abcdefghijklmnopqrstuvwxyz";
constexpr std::string_view kAlphaAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
constexpr std::string_view kAlphanumericAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
constexpr std::string_view kDigitAlphabet = "0123456789";

// The document has already passed validation, so every lookup below is
// expected to succeed; the fallbacks only keep the reads total.
std::string ReadString(const JsonValue& object, std::string_view key) {
  const JsonValue* value = core::json::Find(object, key);
  if (value == nullptr || value->type != JsonValue::Type::kString) {
    return {};
  }
  return value->string_value;
}

std::int64_t ReadInt64(const JsonValue& object, std::string_view key, std::int64_t fallback) {
  const JsonValue* value = core::json::Find(object, key);
  std::int64_t parsed = fallback;
  if (value == nullptr || !core::json::TryGetInt64(*value, parsed)) {
    return fallback;
  }
  return parsed;
}

double ReadNumber(const JsonValue& object, std::string_view key) {
  const JsonValue* value = core::json::Find(object, key);
  double parsed = 0.0;
  if (value == nullptr || !core::json::TryGetFiniteNumber(*value, parsed)) {
    return 0.0;
  }
  return parsed;
}

Field BuildField(const JsonValue& object) {
  Field field;
  field.name = ReadString(object, "name");
  field.data_type = ReadString(object, "data_type");
  field.generator_name = ReadString(object, "generator");
  field.kind = GeneratorKindFromName(field.generator_name);

  switch (field.kind) {
  case GeneratorKind::kInteger:
    field.integer.min = ReadInt64(object, "min", 0);
    field.integer.max = ReadInt64(object, "max", 0);
    break;
  case GeneratorKind::kGauss:
  case GeneratorKind::kGaussFloat:
    field.gauss.mean = ReadNumber(object, "mean");
    field.gauss.std_dev = ReadNumber(object, "std_dev");
    break;
  case GeneratorKind::kString:
    field.string.length = static_cast<std::size_t>(ReadInt64(object, "length", 0));
    if (const JsonValue* charset = core::json::Find(object, "charset"); charset != nullptr) {
      (void)ParseCharacterSet(charset->string_value, field.string.charset);
    }
    break;
  case GeneratorKind::kDate:
    field.date.min_year = static_cast<int>(ReadInt64(object, "min_year", kDefaultDateMinYear));
    field.date.max_year = static_cast<int>(ReadInt64(object, "max_year", kDefaultDateMaxYear));
    break;
  case GeneratorKind::kChoice:
    if (const JsonValue* choices = core::json::Find(object, "choices"); choices != nullptr) {
      field.choice.choices.reserve(choices->array_value.size());
      for (const JsonValue& choice : choices->array_value) {
        field.choice.choices.push_back(choice.string_value);
      }
    }
    break;
  case GeneratorKind::kNone:
    break;
  }

  return field;
}

} // namespace

GeneratorKind GeneratorKindFromName(std::string_view name) {
  if (name == "integer") {
    return GeneratorKind::kInteger;
  }
  if (name == "gauss") {
    return GeneratorKind::kGauss;
  }
  if (name == "gauss_float") {
    return GeneratorKind::kGaussFloat;
  }
  if (name == "string") {
    return GeneratorKind::kString;
  }
  if (name == "date") {
    return GeneratorKind::kDate;
  }
  if (name == "choice") {
    return GeneratorKind::kChoice;
  }
  return GeneratorKind::kNone;
}

const char* ToString(GeneratorKind kind) {
  switch (kind) {
  case GeneratorKind::kNone:
    return "none";
  case GeneratorKind::kInteger:
    return "integer";
  case GeneratorKind::kGauss:
    return "gauss";
  case GeneratorKind::kGaussFloat:
    return "gauss_float";
  case GeneratorKind::kString:
    return "string";
  case GeneratorKind::kDate:
    return "date";
  case GeneratorKind::kChoice:
    return "choice";
  }
  return "none";
}

bool ParseCharacterSet(std::string_view name, CharacterSet& charset) {
  if (name == "upper") {
    charset = CharacterSet::kUpper;
    return true;
  }
  if (name == "lower") {
    charset = CharacterSet::kLower;
    return true;
  }
  if (name == "alpha") {
    charset = CharacterSet::kAlpha;
    return true;
  }
  if (name == "alnum") {
    charset = CharacterSet::kAlphanumeric;
    return true;
  }
  if (name == "digits") {
    charset = CharacterSet::kDigits;
    return true;
  }
  return false;
}

const char* ToString(CharacterSet charset) {
  switch (charset) {
  case CharacterSet::kUpper:
    return "upper";
  case CharacterSet::kLower:
    return "lower";
  case CharacterSet::kAlpha:
    return "alpha";
  case CharacterSet::kAlphanumeric:
    return "alnum";
  case CharacterSet::kDigits:
    return "digits";
  }
  return "upper";
}

std::string_view AlphabetFor(CharacterSet charset) {
  switch (charset) {
  case CharacterSet::kUpper:
    return kUpperAlphabet;
  case CharacterSet::kLower:
    return kLowerAlphabet;
  case CharacterSet::kAlpha:
    return kAlphaAlphabet;
  case CharacterSet::kAlphanumeric:
    return kAlphanumericAlphabet;
  case CharacterSet::kDigits:
    return kDigitAlphabet;
  }
  return kUpperAlphabet;
}

bool ParseSchemaText(std::string_view json_text, Schema& schema, ValidationReport& report,
                     std::string& error) {
  error.clear();
  report = ValidationReport{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    report.issues.push_back({.path = "$", .message = std::move(parse_error)});
    return true;
  }

  ValidateSchemaDocument(root, report);
  if (!report.valid) {
    return true;
  }

  Schema parsed;
  parsed.table_name = ReadString(root, "table_name");
  const JsonValue* fields = core::json::Find(root, "fields");
  if (fields != nullptr) {
    parsed.fields.reserve(fields->array_value.size());
    for (const JsonValue& field : fields->array_value) {
      parsed.AddField(BuildField(field));
    }
  }

  schema = std::move(parsed);
  return true;
}

bool ParseSchemaText(std::string_view json_text, Schema& schema, std::string& error) {
  ValidationReport report;
  if (!ParseSchemaText(json_text, schema, report, error)) {
    return false;
  }
  if (!report.valid) {
    const ValidationIssue& first = report.issues.front();
    error = "invalid schema: " + first.path + ": " + first.message;
    return false;
  }
  return true;
}

bool LoadSchemaFile(const fs::path& schema_path, Schema& schema, ValidationReport& report,
                    std::string& error) {
  std::string text;
  if (!core::ReadTextFile(schema_path, text, error)) {
    return false;
  }
  return ParseSchemaText(text, schema, report, error);
}

bool LoadSchemaFile(const fs::path& schema_path, Schema& schema, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(schema_path, text, error)) {
    return false;
  }
  return ParseSchemaText(text, schema, error);
}

} // namespace fourree::schema
