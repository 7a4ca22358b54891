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

#include <cstdint>

namespace pyfuture {

// Opaque value handed out by a gate when it is acquired or suspended and
// handed back when it is released or resumed.
using gate_ticket = std::uintptr_t;

// The process-wide lock that must be held whenever native code touches
// interpreter-owned memory.
//
// acquire() is reentrant: a thread that already holds the gate may acquire
// it again and must release it the same number of times, in reverse order.
// suspend() gives up a gate held by the calling thread (however many times
// it was acquired) until the matching resume().
class interpreter_gate {
 public:
  virtual ~interpreter_gate() = default;

  virtual gate_ticket acquire() = 0;
  virtual void release(gate_ticket ticket) noexcept = 0;

  virtual gate_ticket suspend() noexcept = 0;
  virtual void resume(gate_ticket ticket) noexcept = 0;

  // Whether the calling thread currently holds the gate.
  virtual bool is_held() const noexcept = 0;
};

class gate_guard;

// Proof that the gate is held by the current thread. Every operation that
// reads or writes interpreter-owned state takes one by reference.
class gate_token {
 public:
  gate_token(const gate_token&) = delete;
  gate_token& operator=(const gate_token&) = delete;

  interpreter_gate& gate() const noexcept { return *gate_; }

  // For code the interpreter calls into, which always runs with the gate
  // already held.
  static gate_token assume_held(interpreter_gate& gate) noexcept {
    PYFUTURE_ASSERT(gate.is_held());
    return gate_token{gate};
  }

 private:
  friend gate_guard;

  explicit gate_token(interpreter_gate& gate) noexcept : gate_(&gate) {}

  interpreter_gate* gate_;
};

// Holds the gate for the lifetime of the guard.
class gate_guard {
 public:
  explicit gate_guard(interpreter_gate& gate)
    : ticket_(gate.acquire()), token_(gate) {}

  gate_guard(const gate_guard&) = delete;
  gate_guard& operator=(const gate_guard&) = delete;

  ~gate_guard() { token_.gate().release(ticket_); }

  gate_token& token() noexcept { return token_; }

 private:
  gate_ticket ticket_;
  gate_token token_;
};

// Lets other threads take the gate while the current one runs code that
// does not touch interpreter state. The token must not be used until the
// release is destroyed.
class gate_release {
 public:
  explicit gate_release(gate_token& token) noexcept
    : gate_(token.gate()), ticket_(gate_.suspend()) {}

  gate_release(const gate_release&) = delete;
  gate_release& operator=(const gate_release&) = delete;

  ~gate_release() { gate_.resume(ticket_); }

 private:
  interpreter_gate& gate_;
  gate_ticket ticket_;
};

} // namespace pyfuture
