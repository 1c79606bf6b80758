#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace fourree::generation {

// Hand-off point between generator workers and the single output writer.
//
// Batches may be pushed in any order but are popped strictly by index
// (0, 1, 2, ...), so the written stream does not depend on thread timing.
// A producer whose index is `capacity` or more ahead of the writer blocks,
// which bounds buffered batches to `capacity`. The producer holding the
// writer's next index is never blocked, so progress is guaranteed as long as
// every index in [0, total) is eventually pushed.
class OrderedBatchQueue {
public:
  OrderedBatchQueue(std::uint64_t total_batches, std::size_t capacity);

  OrderedBatchQueue(const OrderedBatchQueue&) = delete;
  OrderedBatchQueue& operator=(const OrderedBatchQueue&) = delete;

  // Returns false if the queue was cancelled (the payload is discarded).
  bool Push(std::uint64_t index, std::string payload);

  // Blocks until the next batch in order is available. Returns false once all
  // `total_batches` were popped or the queue was cancelled.
  bool PopNext(std::uint64_t& index, std::string& payload);

  // Wakes every blocked producer and the writer; later calls fail fast.
  void Cancel();

  bool cancelled() const;
  std::size_t capacity() const {
    return capacity_;
  }

  struct Snapshot {
    std::uint64_t next_index = 0;
    std::size_t buffered = 0;
    std::size_t max_buffered = 0;
    bool cancelled = false;
  };

  Snapshot DebugSnapshot() const;

private:
  const std::uint64_t total_batches_;
  const std::size_t capacity_;

  mutable std::mutex mu_;
  std::condition_variable producer_cv_;
  std::condition_variable consumer_cv_;
  std::map<std::uint64_t, std::string> pending_;
  std::uint64_t next_index_ = 0;
  std::size_t max_buffered_ = 0;
  bool cancelled_ = false;
};

} // namespace fourree::generation
