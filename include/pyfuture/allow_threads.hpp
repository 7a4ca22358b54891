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

#include <pyfuture/interpreter_gate.hpp>
#include <pyfuture/poll.hpp>
#include <pyfuture/waker.hpp>

#include <type_traits>
#include <utility>

namespace pyfuture {

// Polls the wrapped future with the interpreter gate released, so a future
// that computes or blocks does not keep other threads out of the
// interpreter. The gate is taken before and retaken after each inner poll;
// a caller that already holds it gets it back unchanged.
template <typename Future>
class allow_threads {
 public:
  using output_type = future_output_t<Future>;

  allow_threads(interpreter_gate& gate, Future future) noexcept(
      std::is_nothrow_move_constructible_v<Future>)
    : gate_(&gate)
    , future_(std::move(future)) {}

  poll_result<output_type> poll(const waker& w) {
    gate_guard guard{*gate_};
    gate_release release{guard.token()};
    return future_.poll(w);
  }

  Future& get() noexcept { return future_; }

 private:
  interpreter_gate* gate_;
  Future future_;
};

template <typename Future>
allow_threads(interpreter_gate&, Future) -> allow_threads<Future>;

} // namespace pyfuture
