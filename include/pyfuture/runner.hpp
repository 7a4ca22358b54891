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
#include <pyfuture/closed_notificator.hpp>
#include <pyfuture/config.hpp>
#include <pyfuture/foreign_future.hpp>
#include <pyfuture/interpreter_gate.hpp>
#include <pyfuture/runner_function.hpp>

#include <memory>
#include <optional>
#include <utility>
#include <variant>

namespace pyfuture {

namespace _runner {

template <typename Object>
struct alive_state {
  std::shared_ptr<runner_function<Object>> function_;
  std::shared_ptr<async_shared_mutex> aliveLock_;
  // Held for as long as the runner is alive; see closed_notificator.
  owned_unique_lock livenessGuard_;
};

struct closed_state {};

} // namespace _runner

// Creates foreign futures that run on one interpreter-side runner function.
//
// A runner is alive until close() is called and closed forever after.
// Futures it created keep their own reference to the runner function and
// are not affected by closing; only the creation of new futures is.
template <typename Object>
class runner {
  using alive_state = _runner::alive_state<Object>;
  using closed_state = _runner::closed_state;

 public:
  runner(interpreter_gate& gate, std::shared_ptr<runner_function<Object>> function)
    : gate_(&gate)
    , state_(make_alive(std::move(function))) {}

  runner(const runner&) = delete;
  runner& operator=(const runner&) = delete;

  void close() noexcept {
    if (std::holds_alternative<alive_state>(state_)) {
      state_.template emplace<closed_state>();
    }
  }

  bool is_closed() const noexcept {
    return std::holds_alternative<closed_state>(state_);
  }

  std::optional<foreign_future<Object>> try_create_future(Object awaitable) const {
    auto* alive = std::get_if<alive_state>(&state_);
    if (alive == nullptr) {
      return std::nullopt;
    }
    return foreign_future<Object>{*gate_, alive->function_, std::move(awaitable)};
  }

  foreign_future<Object> create_future(Object awaitable) const {
    auto future = try_create_future(std::move(awaitable));
    PYFUTURE_CHECK(future.has_value(), "The runner is already closed");
    return std::move(*future);
  }

  // Empty once the runner is closed; notificators obtained earlier keep
  // working.
  std::optional<::pyfuture::closed_notificator> closed_notificator() const {
    auto* alive = std::get_if<alive_state>(&state_);
    if (alive == nullptr) {
      return std::nullopt;
    }
    return ::pyfuture::closed_notificator{alive->aliveLock_};
  }

  interpreter_gate& gate() const noexcept { return *gate_; }

 private:
  static alive_state make_alive(
      std::shared_ptr<runner_function<Object>> function) {
    auto aliveLock = std::make_shared<async_shared_mutex>();
    // Nobody else can see the lock yet.
    auto guard = owned_unique_lock::try_lock(aliveLock);
    PYFUTURE_CHECK(guard.has_value(), "fresh runner lock already held");
    return alive_state{
        std::move(function), std::move(aliveLock), std::move(*guard)};
  }

  interpreter_gate* gate_;
  std::variant<alive_state, closed_state> state_;
};

} // namespace pyfuture
