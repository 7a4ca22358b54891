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

#include <pyfuture/exception.hpp>
#include <pyfuture/interpreter_gate.hpp>
#include <pyfuture/outcome.hpp>
#include <pyfuture/waker.hpp>

#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace pyfuture {

// Shared between a foreign_future and the interpreter-side task it started.
// The task reports its outcome here exactly once; the future reads it back.
// All state is guarded by the interpreter gate, so every member that touches
// it takes a gate_token.
template <typename Object>
class completion_handle {
 public:
  using outcome_type = outcome<Object>;

  completion_handle(Object awaitable, waker w) noexcept(
      std::is_nothrow_move_constructible_v<Object>)
    : awaitable_(std::move(awaitable))
    , waker_(std::move(w)) {}

  completion_handle(const completion_handle&) = delete;
  completion_handle& operator=(const completion_handle&) = delete;

  const Object& awaitable() const noexcept { return awaitable_; }

  // Stores the task's result and wakes the native poller. Throws
  // already_completed, without waking, if an outcome is already stored.
  void set_result(gate_token& token, Object value) {
    complete(token, outcome_type::success(std::move(value)));
  }

  void set_exception(gate_token& token, std::exception_ptr error) {
    complete(token, outcome_type::failure(std::move(error)));
  }

  void rebind_waker(gate_token&, const waker& w) noexcept { waker_ = w; }

  const outcome_type* peek_outcome(gate_token&) const noexcept {
    return outcome_ ? &*outcome_ : nullptr;
  }

  bool is_complete(gate_token&) const noexcept { return outcome_.has_value(); }

 private:
  void complete(gate_token&, outcome_type&& result) {
    if (outcome_.has_value()) {
      throw already_completed{};
    }
    outcome_.emplace(std::move(result));
    waker_.wake_by_ref();
  }

  Object awaitable_;
  waker waker_;
  std::optional<outcome_type> outcome_;
};

} // namespace pyfuture
