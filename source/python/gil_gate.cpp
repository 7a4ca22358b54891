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
#include <pyfuture/python/gil_gate.hpp>

namespace pyfuture::python {

gate_ticket gil_gate::acquire() {
  return static_cast<gate_ticket>(PyGILState_Ensure());
}

void gil_gate::release(gate_ticket ticket) noexcept {
  PyGILState_Release(static_cast<PyGILState_STATE>(ticket));
}

gate_ticket gil_gate::suspend() noexcept {
  return reinterpret_cast<gate_ticket>(PyEval_SaveThread());
}

void gil_gate::resume(gate_ticket ticket) noexcept {
  PyEval_RestoreThread(reinterpret_cast<PyThreadState*>(ticket));
}

bool gil_gate::is_held() const noexcept {
  return PyGILState_Check() != 0;
}

gil_gate& gil() noexcept {
  static gil_gate gate;
  return gate;
}

} // namespace pyfuture::python
