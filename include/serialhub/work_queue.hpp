#pragma once
/**
 * @file work_queue.hpp
 * @brief Unbounded FIFO hand-off between relay tasks.
 *
 * One producer side (any thread) pushes; one consumer thread blocks in pop().
 * close() wakes the consumer; items already queued are still handed out, then
 * pop() returns false so the worker loop can end.
 */

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace serialhub {

template <typename T>
class WorkQueue {
public:
  WorkQueue() = default;
  WorkQueue(const WorkQueue&) = delete;
  WorkQueue& operator=(const WorkQueue&) = delete;

  /// Enqueue; false once the queue is closed (item is dropped).
  bool push(T item) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (closed_) return false;
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  /// Block until an item is available or the queue is closed and drained.
  bool pop(T& out) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) return false;
    out = std::move(items_.front());
    items_.pop_front();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return items_.size();
  }

private:
  mutable std::mutex      mtx_;
  std::condition_variable cv_;
  std::deque<T>           items_;
  bool                    closed_{false};
};

} // namespace serialhub
