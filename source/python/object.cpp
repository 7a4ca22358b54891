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
#include <pyfuture/python/object.hpp>

namespace pyfuture::python {

void object::reset() noexcept {
  PyObject* ptr = std::exchange(ptr_, nullptr);
  if (ptr == nullptr) {
    return;
  }
  if (!Py_IsInitialized()) {
    // The interpreter is gone and took the object with it.
    return;
  }
  if (PyGILState_Check()) {
    Py_DECREF(ptr);
    return;
  }
  PyGILState_STATE state = PyGILState_Ensure();
  Py_DECREF(ptr);
  PyGILState_Release(state);
}

} // namespace pyfuture::python
