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

#include <pyfuture/completion_handle.hpp>
#include <pyfuture/config.hpp>
#include <pyfuture/interpreter_gate.hpp>
#include <pyfuture/log.hpp>
#include <pyfuture/outcome.hpp>
#include <pyfuture/poll.hpp>
#include <pyfuture/runner_function.hpp>
#include <pyfuture/waker.hpp>

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace pyfuture {

namespace _ff {

template <typename Object>
struct init_state {
  struct payload {
    std::shared_ptr<runner_function<Object>> runner_;
    Object awaitable_;
  };

  std::optional<payload> payload_;
};

template <typename Object>
struct running_state {
  std::shared_ptr<completion_handle<Object>> handle_;
  std::unique_ptr<cancel_handle> cancel_;
  bool cancellationRequested_ = false;
};

struct done_state {};

} // namespace _ff

// A native future whose value is computed by an interpreter-side task.
//
// Nothing happens until the first poll, which invokes the runner with a new
// completion handle and always returns pending. Later polls report the
// outcome once the task has stored one. Polling after the future returned
// ready is a fatal error.
//
// Dropping a future while its task is running does not cancel the task,
// since that would mean taking the gate from an arbitrary destructor. It
// logs a warning instead; wrap the future in cancel_on_drop to cancel.
template <typename Object>
class foreign_future {
  using init_state = _ff::init_state<Object>;
  using running_state = _ff::running_state<Object>;
  using done_state = _ff::done_state;

 public:
  using output_type = outcome<Object>;
  using handle_type = completion_handle<Object>;

  foreign_future(
      interpreter_gate& gate,
      std::shared_ptr<runner_function<Object>> runner,
      Object awaitable)
    : gate_(&gate)
    , state_(std::in_place_type<init_state>) {
    std::get<init_state>(state_).payload_.emplace(
        typename init_state::payload{std::move(runner), std::move(awaitable)});
  }

  // The moved-from future is left done and is not reported when dropped.
  foreign_future(foreign_future&& other) noexcept
    : gate_(other.gate_)
    , state_(std::exchange(other.state_, done_state{})) {}

  foreign_future& operator=(foreign_future&&) = delete;

  ~foreign_future() {
    if (auto* running = std::get_if<running_state>(&state_);
        running != nullptr && !running->cancellationRequested_) {
      PYFUTURE_LOG_WARNING(
          "foreign_future dropped while the interpreter-side task may still "
          "be running; cancellation was never requested");
    }
  }

  poll_result<output_type> poll(const waker& w) {
    if (auto* init = std::get_if<init_state>(&state_)) {
      return start(*init, w);
    }
    if (auto* running = std::get_if<running_state>(&state_)) {
      return poll_running(*running, w);
    }
    PYFUTURE_FATAL("Polling a done future");
  }

  // Requests cancellation of the running task. A second request on the same
  // future is a no-op. Failures of the request are thrown and leave the
  // future as if no request had been made.
  void cancel(gate_token& token) {
    auto* running = std::get_if<running_state>(&state_);
    PYFUTURE_CHECK(running != nullptr, "Cancel a non-running future");
    if (running->cancellationRequested_) {
      return;
    }
    running->cancel_->cancel(token);
    running->cancellationRequested_ = true;
  }

  bool is_init() const noexcept {
    return std::holds_alternative<init_state>(state_);
  }

  bool is_running() const noexcept {
    return std::holds_alternative<running_state>(state_);
  }

  bool is_done() const noexcept {
    return std::holds_alternative<done_state>(state_);
  }

  bool is_cancellation_requested() const noexcept {
    auto* running = std::get_if<running_state>(&state_);
    return running != nullptr && running->cancellationRequested_;
  }

  interpreter_gate& gate() const noexcept { return *gate_; }

 private:
  poll_result<output_type> start(init_state& init, const waker& w) {
    PYFUTURE_CHECK(
        init.payload_.has_value(),
        "foreign_future init state already consumed");
    auto payload = std::move(*init.payload_);
    init.payload_.reset();

    gate_guard guard{*gate_};
    auto& token = guard.token();

    auto handle =
        std::make_shared<handle_type>(std::move(payload.awaitable_), w);

    std::unique_ptr<cancel_handle> cancel;
    try {
      cancel = (*payload.runner_)(token, handle);
    } catch (const std::exception& ex) {
      runner_failed(token, *payload.runner_, ex.what());
    } catch (...) {
      runner_failed(token, *payload.runner_, "unknown exception");
    }
    PYFUTURE_CHECK(cancel != nullptr, "runner returned no cancel handle");

    state_.template emplace<running_state>(
        running_state{std::move(handle), std::move(cancel), false});
    return poll_result<output_type>::pending();
  }

  poll_result<output_type> poll_running(running_state& running, const waker& w) {
    gate_guard guard{*gate_};
    auto& token = guard.token();

    const output_type* result = running.handle_->peek_outcome(token);
    if (result == nullptr) {
      running.handle_->rebind_waker(token, w);
      return poll_result<output_type>::pending();
    }

    // The copy is taken, and the running state released, while the gate is
    // still held.
    auto ready = poll_result<output_type>::ready(*result);
    state_.template emplace<done_state>();
    return ready;
  }

  [[noreturn]] static void runner_failed(
      gate_token& token,
      const runner_function<Object>& runner,
      const char* what) noexcept {
    std::string message = "Error while calling runner ";
    try {
      message += runner.describe(token);
    } catch (...) {
      message += "<unnamed>";
    }
    message += ": ";
    message += what;
    PYFUTURE_FATAL(message.c_str());
  }

  interpreter_gate* gate_;
  std::variant<init_state, running_state, done_state> state_;
};

} // namespace pyfuture
