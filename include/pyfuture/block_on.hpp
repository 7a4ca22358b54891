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

#include <condition_variable>
#include <memory>
#include <mutex>
#include <type_traits>

namespace pyfuture {
namespace _block_on {

struct thread_parker {
  void wake() noexcept {
    std::lock_guard lock{mutex_};
    notified_ = true;
    cv_.notify_one();
  }

  void park() {
    std::unique_lock lock{mutex_};
    cv_.wait(lock, [this] { return notified_; });
    notified_ = false;
  }

  std::mutex mutex_;
  std::condition_variable cv_;
  bool notified_ = false;
};

} // namespace _block_on

// Drives a future to completion on the calling thread, sleeping between
// wake-ups.
template <typename Future>
future_output_t<std::decay_t<Future>> block_on(Future&& future) {
  auto parker = std::make_shared<_block_on::thread_parker>();
  const waker w = make_waker(parker);
  while (true) {
    auto result = future.poll(w);
    if (result.is_ready()) {
      return result.take();
    }
    parker->park();
  }
}

} // namespace pyfuture
