#pragma once

#include "core/logging/logger.hpp"
#include "generation/row_generator.hpp"
#include "output/output_sink.hpp"
#include "schema/model.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace fourree::generation {

constexpr std::uint64_t kDefaultNumRows = 1000;
constexpr std::uint64_t kDefaultBatchSize = 100;
constexpr std::uint32_t kDefaultThreads = 1;
constexpr std::uint32_t kMaxThreads = 128;

struct GenerationPlan {
  std::uint64_t num_rows = kDefaultNumRows;
  std::uint64_t batch_size = kDefaultBatchSize;
  std::uint32_t num_threads = kDefaultThreads;
  std::uint64_t seed = 0;
  std::string delimiter = std::string(kDefaultDelimiter);
  bool include_header = false;
  // Batches the writer may have buffered; 0 selects twice the worker count.
  std::size_t queue_capacity = 0;
};

struct GenerationResult {
  std::uint64_t rows_written = 0;
  std::uint64_t batches_written = 0;
  std::uint64_t bytes_written = 0;
  std::uint32_t workers_started = 0;
  bool header_written = false;
  std::chrono::milliseconds elapsed{0};
};

// ceil(num_rows / batch_size); 0 when there are no rows. batch_size must be > 0.
std::uint64_t PlanBatchCount(std::uint64_t num_rows, std::uint64_t batch_size);

// Rows in batch `index`: batch_size for every batch but the last, which holds
// the remainder.
std::uint64_t BatchRowCount(std::uint64_t num_rows, std::uint64_t batch_size,
                            std::uint64_t index);

// Generates `plan.num_rows` rows of `schema` into an already opened `sink`.
//
// Contract:
// - Worker w (of min(num_threads, batch count)) generates batches w, w+T, ...
//   with an Rng seeded by DeriveSeed(plan.seed, batch index).
// - The calling thread is the only writer and writes batches in index order,
//   preceded by the header when requested.
// - On a sink or worker failure the queue is cancelled, all workers are
//   joined, and false is returned with `error` set. The sink is not closed.
bool GenerateData(const schema::Schema& schema, const GenerationPlan& plan,
                  output::IOutputSink& sink, core::logging::Logger& logger,
                  GenerationResult& result, std::string& error);

} // namespace fourree::generation
