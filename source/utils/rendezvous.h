// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <mutex>
#include <deque>
#include <chrono>
#include <utility>
#include <optional>
#include <condition_variable>

namespace geodist::utils
{
/**
 * A single collection point for values produced by concurrent tasks.
 * 
 * Producers deliver their value tagged with the slot they were started
 * for, the consumer receives them in arrival order, whatever order the 
 * tasks happen to finish in.
 */
template <typename T>
class rendezvous
{
public:
  using entry_type = std::pair<size_t, T>;

public:
  void deliver(size_t slot, T value)
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      arrived_.emplace_back(slot, std::move(value));
    }
    ready_.notify_one();
  }

  /**
   * Blocks until the next value arrives or the deadline passes,
   * an empty optional means the deadline passed first.
   */
  template <typename Clock, typename Duration>
  std::optional<entry_type> receive_until(
    std::chrono::time_point<Clock, Duration> const& deadline)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!ready_.wait_until(lock, deadline, 
          [this] { return !arrived_.empty(); })) {
      return {};
    }
    entry_type next = std::move(arrived_.front());
    arrived_.pop_front();
    return next;
  }

private:
  std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<entry_type> arrived_;
};
}  // namespace geodist::utils
