#include "schema/validator.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "schema/model.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace fourree::schema {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

void AddWarning(ValidationReport& report, std::string path, std::string message) {
  report.warnings.push_back({.path = std::move(path), .message = std::move(message)});
}

bool IsString(const JsonValue* value) {
  return value != nullptr && value->type == JsonValue::Type::kString;
}

// Reads a required string member. Returns nullptr (after recording the issue)
// when the member is missing or not a string.
const std::string* RequireString(const JsonValue& object, std::string_view key,
                                 const std::string& path, bool allow_empty,
                                 ValidationReport& report) {
  const JsonValue* field = core::json::Find(object, key);
  if (field == nullptr) {
    AddIssue(report, path, "is required");
    return nullptr;
  }
  if (!IsString(field)) {
    AddIssue(report, path, "must be a string");
    return nullptr;
  }
  if (!allow_empty && field->string_value.empty()) {
    AddIssue(report, path, "must not be empty");
    return nullptr;
  }
  return &field->string_value;
}

bool RequireInt64(const JsonValue& object, std::string_view key, const std::string& path,
                  std::int64_t& out, ValidationReport& report) {
  const JsonValue* value = core::json::Find(object, key);
  if (value == nullptr) {
    AddIssue(report, path, "is required");
    return false;
  }
  if (!core::json::TryGetInt64(*value, out)) {
    AddIssue(report, path, "must be an integer in signed 64-bit range");
    return false;
  }
  return true;
}

bool RequireFiniteNumber(const JsonValue& object, std::string_view key, const std::string& path,
                         double& out, ValidationReport& report) {
  const JsonValue* value = core::json::Find(object, key);
  if (value == nullptr) {
    AddIssue(report, path, "is required");
    return false;
  }
  if (!core::json::TryGetFiniteNumber(*value, out)) {
    AddIssue(report, path, "must be a finite number");
    return false;
  }
  return true;
}

void ValidateIntegerField(const JsonValue& field, const std::string& path,
                          ValidationReport& report) {
  std::int64_t min = 0;
  std::int64_t max = 0;
  const bool has_min = RequireInt64(field, "min", path + ".min", min, report);
  const bool has_max = RequireInt64(field, "max", path + ".max", max, report);
  if (has_min && has_max && min > max) {
    AddIssue(report, path + ".max", "must be greater than or equal to min");
  }
}

void ValidateGaussField(const JsonValue& field, const std::string& path,
                        ValidationReport& report) {
  double mean = 0.0;
  double std_dev = 0.0;
  (void)RequireFiniteNumber(field, "mean", path + ".mean", mean, report);
  if (RequireFiniteNumber(field, "std_dev", path + ".std_dev", std_dev, report) &&
      std_dev < 0.0) {
    AddIssue(report, path + ".std_dev", "must be non-negative");
  }
}

void ValidateStringField(const JsonValue& field, const std::string& path,
                         ValidationReport& report) {
  const JsonValue* length = core::json::Find(field, "length");
  if (length == nullptr) {
    AddIssue(report, path + ".length", "is required for a string field");
  } else {
    std::uint64_t parsed = 0;
    if (!core::json::TryGetNonNegativeInteger(*length, parsed)) {
      AddIssue(report, path + ".length", "must be a non-negative integer");
    }
  }

  if (const JsonValue* charset = core::json::Find(field, "charset"); charset != nullptr) {
    CharacterSet parsed = CharacterSet::kUpper;
    if (!IsString(charset) || !ParseCharacterSet(charset->string_value, parsed)) {
      AddIssue(report, path + ".charset", "must be one of: upper, lower, alpha, alnum, digits");
    }
  }
}

void ValidateDateField(const JsonValue& field, const std::string& path,
                       ValidationReport& report) {
  std::int64_t min_year = kDefaultDateMinYear;
  std::int64_t max_year = kDefaultDateMaxYear;
  bool bounds_ok = true;

  auto read_year = [&](std::string_view key, std::int64_t& target) {
    const JsonValue* value = core::json::Find(field, key);
    if (value == nullptr) {
      return;
    }
    const std::string year_path = path + "." + std::string(key);
    if (!core::json::TryGetInt64(*value, target)) {
      AddIssue(report, year_path, "must be an integer year");
      bounds_ok = false;
      return;
    }
    if (target < kMinSupportedYear || target > kMaxSupportedYear) {
      AddIssue(report, year_path, "must be in range [1,9999]");
      bounds_ok = false;
    }
  };

  read_year("min_year", min_year);
  read_year("max_year", max_year);
  if (bounds_ok && min_year > max_year) {
    AddIssue(report, path + ".max_year", "must be greater than or equal to min_year");
  }
}

void ValidateChoiceField(const JsonValue& field, const std::string& path,
                         ValidationReport& report) {
  const JsonValue* choices = core::json::Find(field, "choices");
  if (choices == nullptr) {
    AddIssue(report, path + ".choices", "is required for a choice field");
    return;
  }
  if (choices->type != JsonValue::Type::kArray) {
    AddIssue(report, path + ".choices", "must be an array of strings");
    return;
  }
  if (choices->array_value.empty()) {
    AddIssue(report, path + ".choices", "must contain at least one choice");
    return;
  }
  for (std::size_t i = 0; i < choices->array_value.size(); ++i) {
    if (choices->array_value[i].type != JsonValue::Type::kString) {
      AddIssue(report, path + ".choices[" + std::to_string(i) + "]", "must be a string");
    }
  }
}

void ValidateField(const JsonValue& field, std::size_t index, ValidationReport& report) {
  const std::string path = "fields[" + std::to_string(index) + "]";
  if (field.type != JsonValue::Type::kObject) {
    AddIssue(report, path, "must be an object");
    return;
  }

  (void)RequireString(field, "name", path + ".name", /*allow_empty=*/false, report);
  (void)RequireString(field, "data_type", path + ".data_type", /*allow_empty=*/true, report);
  const std::string* generator =
      RequireString(field, "generator", path + ".generator", /*allow_empty=*/false, report);
  if (generator == nullptr) {
    return;
  }

  switch (GeneratorKindFromName(*generator)) {
  case GeneratorKind::kInteger:
    ValidateIntegerField(field, path, report);
    break;
  case GeneratorKind::kGauss:
  case GeneratorKind::kGaussFloat:
    ValidateGaussField(field, path, report);
    break;
  case GeneratorKind::kString:
    ValidateStringField(field, path, report);
    break;
  case GeneratorKind::kDate:
    ValidateDateField(field, path, report);
    break;
  case GeneratorKind::kChoice:
    ValidateChoiceField(field, path, report);
    break;
  case GeneratorKind::kNone:
    AddWarning(report, path + ".generator",
               "unknown generator '" + *generator + "'; values will render as None");
    break;
  }
}

void ValidateFields(const JsonValue& root, ValidationReport& report) {
  const JsonValue* fields = core::json::Find(root, "fields");
  if (fields == nullptr) {
    AddIssue(report, "fields", "is required");
    return;
  }
  if (fields->type != JsonValue::Type::kArray) {
    AddIssue(report, "fields", "must be an array of field objects");
    return;
  }
  if (fields->array_value.empty()) {
    AddIssue(report, "fields", "must contain at least one field");
    return;
  }

  for (std::size_t i = 0; i < fields->array_value.size(); ++i) {
    ValidateField(fields->array_value[i], i, report);
  }
}

} // namespace

void ValidateSchemaDocument(const core::json::Value& root, ValidationReport& report) {
  report = ValidationReport{};

  if (root.type != JsonValue::Type::kObject) {
    AddIssue(report, "$", std::string("root JSON value must be an object, got ") +
                              core::json::TypeName(root.type));
    return;
  }

  (void)RequireString(root, "table_name", "table_name", /*allow_empty=*/false, report);
  ValidateFields(root, report);

  report.valid = report.issues.empty();
}

bool ValidateSchemaText(std::string_view json_text, ValidationReport& report, std::string& error) {
  error.clear();
  report = ValidationReport{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", parse_error);
    return true;
  }

  ValidateSchemaDocument(root, report);
  return true;
}

bool ValidateSchemaFile(const fs::path& schema_path, ValidationReport& report,
                        std::string& error) {
  std::string text;
  if (!core::ReadTextFile(schema_path, text, error)) {
    return false;
  }
  return ValidateSchemaText(text, report, error);
}

} // namespace fourree::schema
