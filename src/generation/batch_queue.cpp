#include "generation/batch_queue.hpp"

#include <algorithm>
#include <utility>

namespace fourree::generation {

OrderedBatchQueue::OrderedBatchQueue(std::uint64_t total_batches, std::size_t capacity)
    : total_batches_(total_batches), capacity_(std::max<std::size_t>(capacity, 1U)) {}

bool OrderedBatchQueue::Push(std::uint64_t index, std::string payload) {
  std::unique_lock<std::mutex> lock(mu_);
  producer_cv_.wait(lock, [&] {
    return cancelled_ || index < next_index_ + static_cast<std::uint64_t>(capacity_);
  });
  if (cancelled_) {
    return false;
  }

  pending_.emplace(index, std::move(payload));
  max_buffered_ = std::max(max_buffered_, pending_.size());
  if (index == next_index_) {
    consumer_cv_.notify_one();
  }
  return true;
}

bool OrderedBatchQueue::PopNext(std::uint64_t& index, std::string& payload) {
  std::unique_lock<std::mutex> lock(mu_);
  if (next_index_ >= total_batches_) {
    return false;
  }

  consumer_cv_.wait(lock, [&] {
    return cancelled_ || pending_.count(next_index_) != 0U;
  });
  if (cancelled_) {
    return false;
  }

  auto it = pending_.find(next_index_);
  index = it->first;
  payload = std::move(it->second);
  pending_.erase(it);
  ++next_index_;

  // The window moved; any producer may now fit.
  producer_cv_.notify_all();
  return true;
}

void OrderedBatchQueue::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    cancelled_ = true;
    pending_.clear();
  }
  producer_cv_.notify_all();
  consumer_cv_.notify_all();
}

bool OrderedBatchQueue::cancelled() const {
  std::lock_guard<std::mutex> lock(mu_);
  return cancelled_;
}

OrderedBatchQueue::Snapshot OrderedBatchQueue::DebugSnapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return Snapshot{
      .next_index = next_index_,
      .buffered = pending_.size(),
      .max_buffered = max_buffered_,
      .cancelled = cancelled_,
  };
}

} // namespace fourree::generation
