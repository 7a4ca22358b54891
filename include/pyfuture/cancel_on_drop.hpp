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

#include <pyfuture/foreign_future.hpp>
#include <pyfuture/interpreter_gate.hpp>
#include <pyfuture/log.hpp>
#include <pyfuture/poll.hpp>
#include <pyfuture/waker.hpp>

#include <exception>
#include <utility>

namespace pyfuture {

// Owns a foreign_future and requests cancellation of its task if it is
// dropped while the task is still running. The destructor takes the
// interpreter gate, so a cancel_on_drop must not be destroyed on a thread
// that waits for something the gate holder is waiting on.
template <typename Object>
class cancel_on_drop {
 public:
  using output_type = typename foreign_future<Object>::output_type;

  explicit cancel_on_drop(foreign_future<Object> future) noexcept
    : future_(std::move(future)) {}

  cancel_on_drop(cancel_on_drop&&) noexcept = default;
  cancel_on_drop& operator=(cancel_on_drop&&) = delete;

  ~cancel_on_drop() {
    if (!future_.is_running() || future_.is_cancellation_requested()) {
      return;
    }
    try {
      gate_guard guard{future_.gate()};
      future_.cancel(guard.token());
    } catch (const std::exception& ex) {
      PYFUTURE_LOG_WARNING("Error while cancelling on drop: %s", ex.what());
    } catch (...) {
      PYFUTURE_LOG_WARNING("Error while cancelling on drop: unknown error");
    }
  }

  poll_result<output_type> poll(const waker& w) { return future_.poll(w); }

  foreign_future<Object>& get() noexcept { return future_; }
  const foreign_future<Object>& get() const noexcept { return future_; }

 private:
  foreign_future<Object> future_;
};

} // namespace pyfuture
