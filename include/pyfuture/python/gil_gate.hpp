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

namespace pyfuture::python {

// The CPython global interpreter lock as an interpreter_gate.
// acquire()/release() map to PyGILState_Ensure()/PyGILState_Release() and
// suspend()/resume() to PyEval_SaveThread()/PyEval_RestoreThread().
class gil_gate final : public interpreter_gate {
 public:
  gate_ticket acquire() override;
  void release(gate_ticket ticket) noexcept override;

  gate_ticket suspend() noexcept override;
  void resume(gate_ticket ticket) noexcept override;

  bool is_held() const noexcept override;
};

// The process-wide gate for the embedded interpreter.
gil_gate& gil() noexcept;

} // namespace pyfuture::python
