#pragma once

#include "generation/generators.hpp"
#include "schema/model.hpp"

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

namespace fourree::generation {

constexpr std::string_view kDefaultDelimiter = "\t";

// Renders one value for `field`. Unknown generators render `None`.
std::string GenerateFieldValue(const schema::Field& field, Rng& rng);

// Appends one row (values joined by `delimiter`, newline-terminated) to `out`.
void AppendRow(const schema::Schema& schema, Rng& rng, std::string_view delimiter,
               std::string& out);

std::string GenerateRow(const schema::Schema& schema, Rng& rng, std::string_view delimiter);

// `count` consecutive rows as one buffer, ready to hand to a sink.
std::string GenerateRows(const schema::Schema& schema, Rng& rng, std::uint64_t count,
                         std::string_view delimiter);

// Field names joined by `delimiter`, newline-terminated.
std::string GenerateHeader(const schema::Schema& schema, std::string_view delimiter);

// Joins arbitrary streamable values into one row without a trailing newline:
//
//   MakeRow(", ", GenerateInteger(rng, 0, 10), GenerateDate(rng, 1990, 2000).ToString());
template <typename... Values>
std::string MakeRow(std::string_view delimiter, const Values&... values) {
  std::ostringstream out;
  bool first = true;
  auto append = [&](const auto& value) {
    if (!first) {
      out << delimiter;
    }
    first = false;
    out << value;
  };
  (append(values), ...);
  return out.str();
}

} // namespace fourree::generation
