#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace rxg::watcher {

enum class OverflowPolicy {
  kDropOldest,  // producers never stall; the oldest pending item is discarded
  kBlock        // producers wait for space
};

// Multi-producer single-consumer queue with a hard capacity.
template <typename T>
class BoundedEventQueue {
public:
  explicit BoundedEventQueue(std::size_t capacity, OverflowPolicy policy = OverflowPolicy::kDropOldest)
      : capacity_(capacity), policy_(policy) {
    if (capacity_ == 0) {
      throw std::invalid_argument("BoundedEventQueue capacity must be positive");
    }
  }

  BoundedEventQueue(const BoundedEventQueue&) = delete;
  BoundedEventQueue& operator=(const BoundedEventQueue&) = delete;

  // Returns false once the queue is closed.
  bool Push(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (policy_ == OverflowPolicy::kBlock) {
      not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
    }
    if (closed_) {
      return false;
    }
    if (items_.size() >= capacity_) {
      items_.pop_front();
      ++dropped_;
    }
    items_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  // Waits up to |timeout| for the first item, then takes whatever else is
  // already queued, up to |max_items| in total.
  std::vector<T> DrainBatch(std::size_t max_items, std::chrono::milliseconds timeout) {
    std::vector<T> batch;
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); })) {
      return batch;
    }
    while (!items_.empty() && batch.size() < max_items) {
      batch.push_back(std::move(items_.front()));
      items_.pop_front();
    }
    lock.unlock();
    if (!batch.empty()) {
      not_full_.notify_all();
    }
    return batch;
  }

  // Wakes every waiter; later pushes are rejected. Queued items stay drainable.
  void Close() {
    {
      std::lock_guard<std::mutex> guard(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  std::size_t Size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return items_.size();
  }

  // Items discarded by kDropOldest since construction.
  uint64_t Dropped() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return dropped_;
  }

  std::size_t Capacity() const { return capacity_; }
  OverflowPolicy Policy() const { return policy_; }

private:
  const std::size_t capacity_;
  const OverflowPolicy policy_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  uint64_t dropped_{0};
  bool closed_{false};
};

}  // namespace rxg::watcher
