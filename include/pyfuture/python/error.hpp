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

#include <pyfuture/interpreter_gate.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace pyfuture::python {

// A Python exception carried through native code.
//
// what() holds "Type: message" followed by the formatted traceback when one
// is available. The exception instance itself is kept alive so that it can
// be raised again in the interpreter.
class error : public std::runtime_error {
 public:
  // Takes the exception currently set in the interpreter and clears it.
  // If none is set, a RuntimeError describing that is captured instead.
  static error fetch(gate_token& token);

  // Wraps an exception instance.
  static error from_value(gate_token& token, object value);

  const object& value() const noexcept { return *value_; }

  // Sets the exception as the interpreter's current one.
  void restore(gate_token& token) const noexcept;

 private:
  error(std::string what, std::shared_ptr<const object> value)
    : std::runtime_error(what)
    , value_(std::move(value)) {}

  std::shared_ptr<const object> value_;
};

// Raises `message` as `type` in the interpreter and returns the captured
// error, for native code that wants to throw a Python exception.
error make_error(gate_token& token, PyObject* type, const char* message);

// Translates the exception in flight into a Python exception. Used at the
// boundary of functions the interpreter calls.
void set_error_from_current_exception(gate_token& token) noexcept;

} // namespace pyfuture::python
