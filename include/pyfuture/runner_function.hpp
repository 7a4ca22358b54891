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
#include <pyfuture/interpreter_gate.hpp>

#include <memory>
#include <string>

namespace pyfuture {

// Returned by a runner_function; asks the interpreter to cancel the task it
// started. Invoked at most once, with the gate held. Failures are thrown.
class cancel_handle {
 public:
  virtual ~cancel_handle() = default;

  virtual void cancel(gate_token& token) = 0;
};

// The interpreter-side callable that schedules a task for a completion
// handle. It must return promptly, never waiting for the task itself, and
// the task must eventually call set_result() or set_exception() on the
// handle (or neither, in which case the future never resolves).
template <typename Object>
class runner_function {
 public:
  using handle_type = completion_handle<Object>;

  virtual ~runner_function() = default;

  virtual std::unique_ptr<cancel_handle> operator()(
      gate_token& token, std::shared_ptr<handle_type> handle) = 0;

  // Name used in diagnostics when invoking the runner fails.
  virtual std::string describe(gate_token& token) const = 0;
};

} // namespace pyfuture
