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

#include <pyfuture/config.hpp>

#include <optional>
#include <utility>

namespace pyfuture {

// Result of polling a future: either not ready yet (the future has arranged
// for the waker it was given to be woken) or ready with a value.
//
// A pollable future type F exposes `output_type` and
// `poll_result<output_type> poll(const waker&)`.
template <typename T>
class poll_result {
 public:
  using value_type = T;

  poll_result() noexcept = default;

  static poll_result pending() noexcept { return poll_result{}; }

  template <typename... Args>
  static poll_result ready(Args&&... args) {
    poll_result p;
    p.value_.emplace((Args&&)args...);
    return p;
  }

  [[nodiscard]] bool is_ready() const noexcept { return value_.has_value(); }
  [[nodiscard]] bool is_pending() const noexcept { return !value_.has_value(); }

  T& value() & noexcept {
    PYFUTURE_ASSERT(is_ready());
    return *value_;
  }

  const T& value() const& noexcept {
    PYFUTURE_ASSERT(is_ready());
    return *value_;
  }

  T take() {
    PYFUTURE_ASSERT(is_ready());
    T result = std::move(*value_);
    value_.reset();
    return result;
  }

 private:
  std::optional<T> value_;
};

struct unit {
  friend constexpr bool operator==(unit, unit) noexcept { return true; }
  friend constexpr bool operator!=(unit, unit) noexcept { return false; }
};

template <typename Future>
using future_output_t = typename Future::output_type;

} // namespace pyfuture
