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

#include <pyfuture/python/object.hpp>

#include <pyfuture/completion_handle.hpp>
#include <pyfuture/foreign_future.hpp>
#include <pyfuture/interpreter_gate.hpp>
#include <pyfuture/runner.hpp>
#include <pyfuture/runner_function.hpp>

#include <memory>
#include <string>

namespace pyfuture::python {

using py_completion_handle = completion_handle<object>;
using py_foreign_future = foreign_future<object>;
using py_runner = runner<object>;

// A Python callable `runner(handle) -> cancel` used as a runner_function.
// `handle` is a `_pyfuture.CompletionHandle`; `cancel` must be callable
// without arguments.
class runner_callable final : public runner_function<object> {
 public:
  explicit runner_callable(object callable) noexcept
    : callable_(std::move(callable)) {}

  std::unique_ptr<cancel_handle> operator()(
      gate_token& token, std::shared_ptr<py_completion_handle> handle) override;

  std::string describe(gate_token& token) const override;

 private:
  object callable_;
};

// Calls a zero-argument Python callable to request cancellation.
class cancel_callable final : public cancel_handle {
 public:
  explicit cancel_callable(object callable) noexcept
    : callable_(std::move(callable)) {}

  void cancel(gate_token& token) override;

 private:
  object callable_;
};

// Wraps `handle` in a new `_pyfuture.CompletionHandle` instance.
object wrap_completion_handle(
    gate_token& token, std::shared_ptr<py_completion_handle> handle);

// Creates a `_pyfuture.Runner` around a runner callable.
object make_runner(gate_token& token, object callable);

// The native runner behind a `_pyfuture.Runner` instance. Throws error
// (TypeError) if `runner` is not one.
py_runner& get_runner(gate_token& token, PyObject* runner);

// A future for `awaitable` from a `_pyfuture.Runner`. Throws runner_closed
// if the runner has been closed.
py_foreign_future create_future(
    gate_token& token, PyObject* runner, object awaitable);

// Adds `_pyfuture` to the built-in modules of an embedding host. Must be
// called before Py_Initialize().
void register_module();

} // namespace pyfuture::python

extern "C" PyObject* PyInit__pyfuture();
