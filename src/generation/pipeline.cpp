#include "generation/pipeline.hpp"

#include "generation/batch_queue.hpp"
#include "generation/row_generator.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace fourree::generation {

namespace {

struct WorkerContext {
  const schema::Schema& schema;
  const GenerationPlan& plan;
  std::uint64_t total_batches = 0;
  std::uint32_t worker_count = 0;
  OrderedBatchQueue& queue;
  core::logging::Logger& logger;
  std::function<void(std::string)> report_failure;
};

void RunWorker(const WorkerContext& ctx, std::uint32_t worker_index) {
  try {
    std::uint64_t batches = 0;
    for (std::uint64_t index = worker_index; index < ctx.total_batches;
         index += ctx.worker_count) {
      const auto batch_start = std::chrono::steady_clock::now();
      const std::uint64_t rows = BatchRowCount(ctx.plan.num_rows, ctx.plan.batch_size, index);

      Rng rng(DeriveSeed(ctx.plan.seed, index));
      std::string payload = GenerateRows(ctx.schema, rng, rows, ctx.plan.delimiter);
      const auto batch_elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now() - batch_start);

      ctx.logger.Debug(
          "batch generated",
          {{"worker", std::to_string(worker_index)},
           {"batch", std::to_string(index)},
           {"rows", std::to_string(rows)},
           {"elapsed_us", std::to_string(batch_elapsed.count())}});

      if (!ctx.queue.Push(index, std::move(payload))) {
        // Writer gave up; whoever cancelled already recorded the reason.
        return;
      }
      ++batches;
    }

    ctx.logger.Debug("worker completed",
                     {{"worker", std::to_string(worker_index)},
                      {"batches", std::to_string(batches)}});
  } catch (const std::exception& ex) {
    ctx.report_failure("worker " + std::to_string(worker_index) + " failed: " + ex.what());
  }
}

} // namespace

std::uint64_t PlanBatchCount(std::uint64_t num_rows, std::uint64_t batch_size) {
  if (batch_size == 0U || num_rows == 0U) {
    return 0;
  }
  return num_rows / batch_size + (num_rows % batch_size != 0U ? 1U : 0U);
}

std::uint64_t BatchRowCount(std::uint64_t num_rows, std::uint64_t batch_size,
                            std::uint64_t index) {
  if (batch_size == 0U) {
    return 0;
  }
  const std::uint64_t batch_count = PlanBatchCount(num_rows, batch_size);
  if (index >= batch_count) {
    return 0;
  }
  if (index + 1U < batch_count) {
    return batch_size;
  }
  return num_rows - index * batch_size;
}

bool GenerateData(const schema::Schema& schema, const GenerationPlan& plan,
                  output::IOutputSink& sink, core::logging::Logger& logger,
                  GenerationResult& result, std::string& error) {
  result = GenerationResult{};
  error.clear();

  if (plan.batch_size == 0U) {
    error = "batch_size must be greater than 0";
    return false;
  }
  if (plan.num_threads == 0U) {
    error = "num_threads must be greater than 0";
    return false;
  }

  const auto started = std::chrono::steady_clock::now();
  const std::uint64_t total_batches = PlanBatchCount(plan.num_rows, plan.batch_size);
  const auto worker_count = static_cast<std::uint32_t>(
      std::min<std::uint64_t>(plan.num_threads, total_batches));
  const std::size_t capacity =
      plan.queue_capacity != 0U ? plan.queue_capacity
                                : std::max<std::size_t>(2U * worker_count, 1U);

  logger.Info("generation started",
              {{"rows", std::to_string(plan.num_rows)},
               {"batch_size", std::to_string(plan.batch_size)},
               {"batches", std::to_string(total_batches)},
               {"workers", std::to_string(worker_count)},
               {"seed", std::to_string(plan.seed)},
               {"output", sink.Describe()}});

  if (plan.include_header) {
    const std::string header = GenerateHeader(schema, plan.delimiter);
    if (!sink.Write(header, error)) {
      error = "failed to write header: " + error;
      return false;
    }
    result.header_written = true;
    result.bytes_written += header.size();
  }

  OrderedBatchQueue queue(total_batches, capacity);

  std::mutex failure_mu;
  std::string worker_failure;
  auto report_failure = [&](std::string message) {
    {
      std::lock_guard<std::mutex> lock(failure_mu);
      if (worker_failure.empty()) {
        worker_failure = std::move(message);
      }
    }
    queue.Cancel();
  };

  const WorkerContext ctx{
      .schema = schema,
      .plan = plan,
      .total_batches = total_batches,
      .worker_count = worker_count,
      .queue = queue,
      .logger = logger,
      .report_failure = report_failure,
  };

  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  try {
    for (std::uint32_t w = 0; w < worker_count; ++w) {
      workers.emplace_back(RunWorker, std::cref(ctx), w);
    }
  } catch (const std::system_error& ex) {
    report_failure(std::string("failed to start worker thread: ") + ex.what());
  }
  result.workers_started = static_cast<std::uint32_t>(workers.size());

  std::string write_error;
  std::uint64_t index = 0;
  std::string payload;
  while (queue.PopNext(index, payload)) {
    if (!sink.Write(payload, write_error)) {
      queue.Cancel();
      break;
    }
    result.rows_written += BatchRowCount(plan.num_rows, plan.batch_size, index);
    result.bytes_written += payload.size();
    ++result.batches_written;
  }

  for (auto& worker : workers) {
    worker.join();
  }
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (!write_error.empty()) {
    error = "failed to write batch " + std::to_string(index) + ": " + write_error;
    return false;
  }
  if (!worker_failure.empty()) {
    error = worker_failure;
    return false;
  }
  if (result.batches_written != total_batches) {
    error = "generation stopped after " + std::to_string(result.batches_written) + " of " +
            std::to_string(total_batches) + " batches";
    return false;
  }

  logger.Info("generation completed",
              {{"rows_written", std::to_string(result.rows_written)},
               {"batches_written", std::to_string(result.batches_written)},
               {"bytes_written", std::to_string(result.bytes_written)},
               {"elapsed_ms", std::to_string(result.elapsed.count())}});
  return true;
}

} // namespace fourree::generation
