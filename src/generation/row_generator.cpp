#include "generation/row_generator.hpp"

namespace fourree::generation {

namespace {

constexpr std::string_view kNoValue = "None";

std::string FormatFloat(double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

} // namespace

std::string GenerateFieldValue(const schema::Field& field, Rng& rng) {
  switch (field.kind) {
  case schema::GeneratorKind::kInteger:
    return std::to_string(GenerateInteger(rng, field.integer.min, field.integer.max));
  case schema::GeneratorKind::kGauss:
    return std::to_string(GenerateGauss(rng, field.gauss.mean, field.gauss.std_dev));
  case schema::GeneratorKind::kGaussFloat:
    return FormatFloat(GenerateGaussFloat(rng, field.gauss.mean, field.gauss.std_dev));
  case schema::GeneratorKind::kString:
    return GenerateString(rng, field.string.length, schema::AlphabetFor(field.string.charset));
  case schema::GeneratorKind::kDate:
    return GenerateDate(rng, field.date.min_year, field.date.max_year).ToString();
  case schema::GeneratorKind::kChoice:
    if (field.choice.choices.empty()) {
      return std::string(kNoValue);
    }
    return GenerateChoice(rng, field.choice.choices);
  case schema::GeneratorKind::kNone:
    break;
  }
  return std::string(kNoValue);
}

void AppendRow(const schema::Schema& schema, Rng& rng, std::string_view delimiter,
               std::string& out) {
  for (std::size_t i = 0; i < schema.fields.size(); ++i) {
    if (i != 0U) {
      out.append(delimiter);
    }
    out.append(GenerateFieldValue(schema.fields[i], rng));
  }
  out.push_back('\n');
}

std::string GenerateRow(const schema::Schema& schema, Rng& rng, std::string_view delimiter) {
  std::string row;
  AppendRow(schema, rng, delimiter, row);
  return row;
}

std::string GenerateRows(const schema::Schema& schema, Rng& rng, std::uint64_t count,
                         std::string_view delimiter) {
  std::string rows;
  for (std::uint64_t i = 0; i < count; ++i) {
    AppendRow(schema, rng, delimiter, rows);
  }
  return rows;
}

std::string GenerateHeader(const schema::Schema& schema, std::string_view delimiter) {
  std::string header;
  for (std::size_t i = 0; i < schema.fields.size(); ++i) {
    if (i != 0U) {
      header.append(delimiter);
    }
    header.append(schema.fields[i].name);
  }
  header.push_back('\n');
  return header;
}

} // namespace fourree::generation
