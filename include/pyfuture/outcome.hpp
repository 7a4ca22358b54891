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

#include <exception>
#include <utility>
#include <variant>

namespace pyfuture {

// Value produced by an interpreter-side task, or the failure it raised.
template <typename T>
class outcome {
 public:
  using value_type = T;

  template <typename... Args>
  static outcome success(Args&&... args) {
    return outcome{std::in_place_index<0>, (Args&&)args...};
  }

  static outcome failure(std::exception_ptr error) noexcept {
    PYFUTURE_ASSERT(error != nullptr);
    return outcome{std::in_place_index<1>, std::move(error)};
  }

  [[nodiscard]] bool has_value() const noexcept { return state_.index() == 0; }
  [[nodiscard]] bool has_error() const noexcept { return state_.index() == 1; }

  T& value() & noexcept { return *std::get_if<0>(&state_); }
  const T& value() const& noexcept { return *std::get_if<0>(&state_); }
  T&& value() && noexcept { return std::move(*std::get_if<0>(&state_)); }

  const std::exception_ptr& error() const noexcept {
    return *std::get_if<1>(&state_);
  }

  // Returns the value or rethrows the failure.
  T get() && {
    if (has_error()) {
      std::rethrow_exception(error());
    }
    return std::move(*this).value();
  }

 private:
  template <std::size_t I, typename... Args>
  explicit outcome(std::in_place_index_t<I> tag, Args&&... args)
    : state_(tag, (Args&&)args...) {}

  std::variant<T, std::exception_ptr> state_;
};

} // namespace pyfuture
