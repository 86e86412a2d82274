#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace callscribe::util {

/*
  Thread-safe bounded blocking queue.

  Producers block (up to a caller supplied wait) while the queue is full,
  consumers block while it is empty. Close() wakes everyone; consumers keep
  draining what is left and then observe std::nullopt.
*/
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
  }

  BoundedQueue(const BoundedQueue&)            = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Returns false when the queue stayed full for `wait` or is closed.
  template <typename Rep, typename Period>
  bool Push(T item, std::chrono::duration<Rep, Period> wait) {
    {
      std::unique_lock lock(mutex_);
      if (!not_full_.wait_for(lock, wait, [&] { return closed_ || queue_.size() < capacity_; })) {
        return false;
      }
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(item));
    }
    not_empty_.notify_one();
    return true;
  }

  bool TryPush(T item) {
    return Push(std::move(item), std::chrono::milliseconds(0));
  }

  // blocking wait
  std::optional<T> Pop() {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [&] { return closed_ || !queue_.empty(); });
    return TakeFrontLocked(lock);
  }

  template <typename Rep, typename Period>
  std::optional<T> PopFor(std::chrono::duration<Rep, Period> wait) {
    std::unique_lock lock(mutex_);
    not_empty_.wait_for(lock, wait, [&] { return closed_ || !queue_.empty(); });
    return TakeFrontLocked(lock);
  }

  std::vector<T> DrainAll() {
    std::vector<T> out;
    {
      std::lock_guard lock(mutex_);
      out.reserve(queue_.size());
      while (!queue_.empty()) {
        out.push_back(std::move(queue_.front()));
        queue_.pop_front();
      }
    }
    not_full_.notify_all();
    return out;
  }

  void Close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool Closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  std::optional<T> TakeFrontLocked(std::unique_lock<std::mutex>& lock) {
    if (queue_.empty()) {
      return std::nullopt;
    }
    T item = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  const std::size_t       capacity_;
  mutable std::mutex      mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T>           queue_;
  bool                    closed_ = false;
};

} // namespace callscribe::util
