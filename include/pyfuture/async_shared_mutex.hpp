/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * Licensed under the Apache License Version 2.0 with LLVM Exceptions
 * (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 *   https://llvm.org/LICENSE.txt
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <pyfuture/poll.hpp>
#include <pyfuture/waker.hpp>

#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace pyfuture {

// Reader-writer lock for futures. A shared acquisition that cannot be
// granted immediately parks the caller's waker in a FIFO queue instead of
// blocking the thread; unlocking grants the lock to queued waiters in order
// and wakes them.
class async_shared_mutex {
  struct waiter {
    waker waker_;
    bool unique_;
    bool granted_ = false;
  };

 public:
  class shared_lock_future;

  async_shared_mutex() noexcept;
  async_shared_mutex(const async_shared_mutex&) = delete;
  async_shared_mutex(async_shared_mutex&&) = delete;
  ~async_shared_mutex();

  async_shared_mutex& operator=(const async_shared_mutex&) = delete;
  async_shared_mutex& operator=(async_shared_mutex&&) = delete;

  [[nodiscard]] bool try_lock() noexcept;
  [[nodiscard]] bool try_lock_shared() noexcept;

  // Resolves once the calling task holds the lock in shared mode; the
  // holder must call unlock_shared(). Dropping the future before it
  // resolves gives up its place in the queue.
  [[nodiscard]] shared_lock_future lock_shared_async() noexcept;

  // Blocks the calling thread until the lock is held in shared mode.
  void lock_shared();

  void unlock() noexcept;
  void unlock_shared() noexcept;

  class shared_lock_future {
   public:
    using output_type = unit;

    shared_lock_future(shared_lock_future&& other) noexcept
      : mutex_(other.mutex_)
      , waiter_(std::move(other.waiter_))
      , completed_(std::exchange(other.completed_, true)) {}

    shared_lock_future& operator=(shared_lock_future&&) = delete;

    ~shared_lock_future();

    poll_result<unit> poll(const waker& w);

   private:
    friend async_shared_mutex;

    explicit shared_lock_future(async_shared_mutex& mutex) noexcept
      : mutex_(&mutex) {}

    async_shared_mutex* mutex_;
    std::shared_ptr<waiter> waiter_;
    bool completed_ = false;
  };

 private:
  // Grants the lock to queued waiters that can now hold it and collects
  // their wakers. Called with mutex_ held.
  void grant_waiters(std::vector<waker>& toWake) noexcept;

  bool try_enqueue(const std::shared_ptr<waiter>& w) noexcept;
  void cancel_waiter(const std::shared_ptr<waiter>& w) noexcept;

  std::mutex mutex_;
  int activeUniqueCount_;
  int activeSharedCount_;
  std::list<std::shared_ptr<waiter>> pendingQueue_;
};

inline async_shared_mutex::shared_lock_future
async_shared_mutex::lock_shared_async() noexcept {
  return shared_lock_future{*this};
}

// Keeps an async_shared_mutex locked in unique mode until destroyed.
class owned_unique_lock {
 public:
  static std::optional<owned_unique_lock> try_lock(
      std::shared_ptr<async_shared_mutex> mutex) noexcept {
    if (!mutex->try_lock()) {
      return std::nullopt;
    }
    return owned_unique_lock{std::move(mutex)};
  }

  owned_unique_lock(owned_unique_lock&& other) noexcept = default;
  owned_unique_lock& operator=(owned_unique_lock&&) = delete;

  ~owned_unique_lock() {
    if (mutex_) {
      mutex_->unlock();
    }
  }

 private:
  explicit owned_unique_lock(std::shared_ptr<async_shared_mutex> mutex) noexcept
    : mutex_(std::move(mutex)) {}

  std::shared_ptr<async_shared_mutex> mutex_;
};

} // namespace pyfuture
