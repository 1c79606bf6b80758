#pragma once

#include "core/json_dom.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fourree::schema {

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
  // Non-fatal findings (e.g. unknown generator names) that still allow a run.
  std::vector<ValidationIssue> warnings;
};

// Validates an already parsed document. Fills `report` from scratch.
void ValidateSchemaDocument(const core::json::Value& root, ValidationReport& report);

// Validates table schema JSON text.
//
// Contract:
// - Returns true when validation completed (even if the schema is invalid).
// - Returns false only for internal failures outside the validation flow.
// - Populates `report.valid`, `report.issues` and `report.warnings`.
// - JSON syntax errors become one issue under path `$`.
bool ValidateSchemaText(std::string_view json_text, ValidationReport& report, std::string& error);

// Loads and validates a schema file.
//
// Contract:
// - Returns false if file I/O fails and sets `error`.
// - Otherwise returns true and populates `report`.
bool ValidateSchemaFile(const std::filesystem::path& schema_path, ValidationReport& report,
                        std::string& error);

} // namespace fourree::schema
