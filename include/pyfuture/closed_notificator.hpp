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

#include <pyfuture/async_shared_mutex.hpp>
#include <pyfuture/poll.hpp>
#include <pyfuture/waker.hpp>

#include <memory>
#include <optional>

namespace pyfuture {

// Resolves once the runner the notificator observes has been closed.
class closed_future {
 public:
  using output_type = unit;

  explicit closed_future(std::shared_ptr<async_shared_mutex> aliveLock) noexcept
    : aliveLock_(std::move(aliveLock))
    , lock_(aliveLock_->lock_shared_async()) {}

  closed_future(closed_future&&) noexcept = default;
  closed_future& operator=(closed_future&&) = delete;

  poll_result<unit> poll(const waker& w);

 private:
  std::shared_ptr<async_shared_mutex> aliveLock_;
  async_shared_mutex::shared_lock_future lock_;
};

// Observes whether a runner has been closed.
//
// While the runner is alive it holds the unique lock of the shared
// async_shared_mutex. Closing the runner releases it, which is the only
// way a shared acquisition made here can succeed. The notificator never
// takes the lock in unique mode.
class closed_notificator {
 public:
  explicit closed_notificator(
      std::shared_ptr<async_shared_mutex> aliveLock) noexcept
    : aliveLock_(std::move(aliveLock)) {}

  [[nodiscard]] bool is_closed() const noexcept;

  // Suspends the calling task, not its thread, until the runner is closed.
  [[nodiscard]] closed_future wait() const noexcept;

  void blocking_wait() const;

 private:
  std::shared_ptr<async_shared_mutex> aliveLock_;
};

} // namespace pyfuture
