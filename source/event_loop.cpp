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
#include <pyfuture/event_loop.hpp>

#include <algorithm>

namespace pyfuture {
namespace _event_loop {

void task_base::schedule() noexcept {
  if (queued_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  if (auto queue = queue_.lock()) {
    queue->enqueue(shared_from_this());
  }
}

void task_base::retire() noexcept {
  auto queue = queue_.lock();
  if (!queue) {
    return;
  }
  auto self = shared_from_this();
  std::lock_guard lock{queue->mutex_};
  queue->live_.erase(self);
  queue->ready_.erase(
      std::remove(queue->ready_.begin(), queue->ready_.end(), self),
      queue->ready_.end());
}

void run_queue::enqueue(std::shared_ptr<task_base> task) noexcept {
  std::lock_guard lock{mutex_};
  if (live_.count(task) == 0) {
    // Completed or abandoned.
    return;
  }
  ready_.push_back(std::move(task));
  cv_.notify_one();
}

context::context() : queue_(std::make_shared<run_queue>()) {}

context::~context() {
  std::deque<std::shared_ptr<task_base>> ready;
  std::unordered_set<std::shared_ptr<task_base>> live;
  {
    std::lock_guard lock{queue_->mutex_};
    ready.swap(queue_->ready_);
    live.swap(queue_->live_);
  }
  // Unfinished futures are destroyed here, outside the queue lock; dropping
  // one may take the interpreter gate.
}

void context::run_one(std::shared_ptr<task_base> t) {
  t->queued_.store(false, std::memory_order_release);
  t->run();
}

void context::run() {
  std::unique_lock lock{queue_->mutex_};
  while (true) {
    while (queue_->ready_.empty()) {
      if (queue_->stop_) {
        queue_->stop_ = false;
        return;
      }
      queue_->cv_.wait(lock);
    }
    auto t = std::move(queue_->ready_.front());
    queue_->ready_.pop_front();
    lock.unlock();
    run_one(std::move(t));
    lock.lock();
  }
}

std::size_t context::run_until_idle() {
  std::size_t polls = 0;
  while (true) {
    std::shared_ptr<task_base> t;
    {
      std::lock_guard lock{queue_->mutex_};
      if (queue_->ready_.empty()) {
        return polls;
      }
      t = std::move(queue_->ready_.front());
      queue_->ready_.pop_front();
    }
    run_one(std::move(t));
    ++polls;
  }
}

void context::stop() {
  std::lock_guard lock{queue_->mutex_};
  queue_->stop_ = true;
  queue_->cv_.notify_all();
}

std::size_t context::pending_tasks() const {
  std::lock_guard lock{queue_->mutex_};
  return queue_->live_.size();
}

} // namespace _event_loop
} // namespace pyfuture
