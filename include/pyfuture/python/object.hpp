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

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <pyfuture/config.hpp>

#include <utility>

namespace pyfuture::python {

// Owning reference to a Python object.
//
// Copying requires the GIL; the bridge only copies outcomes while holding
// the interpreter gate. Destruction takes the GIL itself when the current
// thread does not hold it, so results may be dropped anywhere.
class object {
 public:
  object() noexcept = default;

  static object steal(PyObject* ptr) noexcept { return object{ptr}; }

  static object borrow(PyObject* ptr) noexcept {
    Py_XINCREF(ptr);
    return object{ptr};
  }

  object(const object& other) noexcept : ptr_(other.ptr_) {
    PYFUTURE_ASSERT(ptr_ == nullptr || PyGILState_Check());
    Py_XINCREF(ptr_);
  }

  object(object&& other) noexcept : ptr_(std::exchange(other.ptr_, nullptr)) {}

  object& operator=(object other) noexcept {
    std::swap(ptr_, other.ptr_);
    return *this;
  }

  ~object() { reset(); }

  void reset() noexcept;

  PyObject* get() const noexcept { return ptr_; }

  [[nodiscard]] PyObject* release() noexcept {
    return std::exchange(ptr_, nullptr);
  }

  explicit operator bool() const noexcept { return ptr_ != nullptr; }

 private:
  explicit object(PyObject* ptr) noexcept : ptr_(ptr) {}

  PyObject* ptr_ = nullptr;
};

} // namespace pyfuture::python
