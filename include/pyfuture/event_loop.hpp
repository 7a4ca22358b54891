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

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace pyfuture {
namespace _event_loop {

class context;
struct run_queue;

struct task_base : std::enable_shared_from_this<task_base> {
  explicit task_base(std::weak_ptr<run_queue> queue) noexcept
    : queue_(std::move(queue)) {}

  virtual ~task_base() = default;

  // Polls the task once. Does nothing once the task has completed.
  virtual void run() = 0;

  void schedule() noexcept;

  // Removes the task from its loop, including any pending wake-up. Called
  // before the completion callback runs.
  void retire() noexcept;

  std::weak_ptr<run_queue> queue_;
  std::atomic<bool> queued_{false};
  std::optional<waker> waker_;
};

struct task_waker {
  void wake() noexcept {
    if (auto task = task_.lock()) {
      task->schedule();
    }
  }

  std::weak_ptr<task_base> task_;
};

struct run_queue {
  void enqueue(std::shared_ptr<task_base> task) noexcept;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::shared_ptr<task_base>> ready_;
  std::unordered_set<std::shared_ptr<task_base>> live_;
  bool stop_ = false;
};

template <typename Future, typename Callback>
struct task final : task_base {
  task(std::weak_ptr<run_queue> queue, Future future, Callback callback)
    : task_base(std::move(queue))
    , future_(std::in_place, std::move(future))
    , callback_(std::move(callback)) {}

  void run() override {
    if (!future_) {
      return;
    }
    if (!waker_) {
      waker_.emplace(make_waker(
          std::make_shared<task_waker>(task_waker{weak_from_this()})));
    }
    auto result = future_->poll(*waker_);
    if (result.is_pending()) {
      return;
    }
    future_.reset();
    retire();
    callback_(result.take());
  }

  std::optional<Future> future_;
  Callback callback_;
};

// Single-threaded executor for pollable futures. Woken tasks are queued
// and polled by whichever thread is inside run() or run_until_idle().
// Wakers may be invoked from any thread.
class context {
 public:
  context();
  context(const context&) = delete;
  context& operator=(const context&) = delete;

  // Destroys the futures of tasks that have not completed.
  ~context();

  // Polls `future` until it is ready, then passes its output to `callback`.
  template <typename Future, typename Callback>
  void spawn(Future future, Callback callback) {
    using task_t = task<std::decay_t<Future>, std::decay_t<Callback>>;
    auto t = std::make_shared<task_t>(
        queue_, std::move(future), std::move(callback));
    {
      std::lock_guard lock{queue_->mutex_};
      queue_->live_.insert(t);
    }
    t->schedule();
  }

  // Runs tasks as they become ready until stop() is called.
  void run();

  // Runs tasks until none is ready. Returns the number of polls made.
  std::size_t run_until_idle();

  void stop();

  std::size_t pending_tasks() const;

 private:
  void run_one(std::shared_ptr<task_base> t);

  std::shared_ptr<run_queue> queue_;
};

} // namespace _event_loop

using event_loop = _event_loop::context;

} // namespace pyfuture
