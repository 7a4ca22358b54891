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
#include <pyfuture/python/module.hpp>

#include <structmember.h>

#include <pyfuture/python/error.hpp>
#include <pyfuture/python/gil_gate.hpp>

#include <pyfuture/exception.hpp>
#include <pyfuture/log.hpp>

#include <cstddef>
#include <exception>
#include <new>
#include <utility>

namespace pyfuture::python {

namespace {

// Instance layout of `_pyfuture.CompletionHandle`.
struct completion_handle_object {
  PyObject_HEAD
  std::shared_ptr<py_completion_handle> handle;
};

// Instance layout of `_pyfuture.Runner`.
struct runner_object {
  PyObject_HEAD
  std::unique_ptr<py_runner> runner;
  PyObject* weakreflist;
};

PyTypeObject* completionHandleType = nullptr;
PyTypeObject* runnerType = nullptr;

//
// CompletionHandle
//

void completion_handle_dealloc(PyObject* self) {
  auto* obj = reinterpret_cast<completion_handle_object*>(self);
  PyTypeObject* type = Py_TYPE(self);
  obj->handle.~shared_ptr();
  type->tp_free(self);
  Py_DECREF(type);
}

PyObject* completion_handle_set_result(PyObject* self, PyObject* value) {
  auto token = gate_token::assume_held(gil());
  auto* obj = reinterpret_cast<completion_handle_object*>(self);
  try {
    obj->handle->set_result(token, object::borrow(value));
  } catch (...) {
    set_error_from_current_exception(token);
    return nullptr;
  }
  Py_RETURN_NONE;
}

PyObject* completion_handle_set_exception(PyObject* self, PyObject* exception) {
  auto token = gate_token::assume_held(gil());
  if (!PyExceptionInstance_Check(exception)) {
    PyErr_SetString(
        PyExc_TypeError, "set_exception() expects an exception instance");
    return nullptr;
  }
  auto* obj = reinterpret_cast<completion_handle_object*>(self);
  try {
    obj->handle->set_exception(
        token,
        std::make_exception_ptr(
            error::from_value(token, object::borrow(exception))));
  } catch (...) {
    set_error_from_current_exception(token);
    return nullptr;
  }
  Py_RETURN_NONE;
}

PyObject* completion_handle_get_awaitable(PyObject* self, void*) {
  auto* obj = reinterpret_cast<completion_handle_object*>(self);
  PyObject* awaitable = obj->handle->awaitable().get();
  if (awaitable == nullptr) {
    Py_RETURN_NONE;
  }
  Py_INCREF(awaitable);
  return awaitable;
}

PyMethodDef completionHandleMethods[] = {
    {"set_result",
     completion_handle_set_result,
     METH_O,
     "Report the awaitable's result and wake the native future."},
    {"set_exception",
     completion_handle_set_exception,
     METH_O,
     "Report the exception the awaitable raised and wake the native future."},
    {nullptr, nullptr, 0, nullptr}};

PyGetSetDef completionHandleGetSet[] = {
    {"awaitable",
     completion_handle_get_awaitable,
     nullptr,
     "The awaitable the native future is waiting for.",
     nullptr},
    {nullptr, nullptr, nullptr, nullptr, nullptr}};

PyType_Slot completionHandleSlots[] = {
    {Py_tp_dealloc, reinterpret_cast<void*>(&completion_handle_dealloc)},
    {Py_tp_methods, completionHandleMethods},
    {Py_tp_getset, completionHandleGetSet},
    {Py_tp_doc,
     const_cast<char*>(
         "Completion handle passed to a runner by a native future.")},
    {0, nullptr}};

PyType_Spec completionHandleSpec = {
    "_pyfuture.CompletionHandle",
    sizeof(completion_handle_object),
    0,
    Py_TPFLAGS_DEFAULT | Py_TPFLAGS_DISALLOW_INSTANTIATION,
    completionHandleSlots};

//
// Runner
//

PyObject* runner_new(PyTypeObject* type, PyObject* args, PyObject* kwargs) {
  PyObject* callable = nullptr;
  static const char* keywords[] = {"runner", nullptr};
  if (!PyArg_ParseTupleAndKeywords(
          args, kwargs, "O:Runner", const_cast<char**>(keywords), &callable)) {
    return nullptr;
  }
  if (!PyCallable_Check(callable)) {
    PyErr_SetString(PyExc_TypeError, "Runner() expects a callable");
    return nullptr;
  }

  auto token = gate_token::assume_held(gil());
  PyObject* self = type->tp_alloc(type, 0);
  if (self == nullptr) {
    return nullptr;
  }
  auto* obj = reinterpret_cast<runner_object*>(self);
  obj->weakreflist = nullptr;
  new (&obj->runner) std::unique_ptr<py_runner>();
  try {
    obj->runner = std::make_unique<py_runner>(
        gil(), std::make_shared<runner_callable>(object::borrow(callable)));
  } catch (...) {
    set_error_from_current_exception(token);
    Py_DECREF(self);
    return nullptr;
  }
  return self;
}

void runner_dealloc(PyObject* self) {
  auto* obj = reinterpret_cast<runner_object*>(self);
  PyTypeObject* type = Py_TYPE(self);
  if (obj->weakreflist != nullptr) {
    PyObject_ClearWeakRefs(self);
  }
  obj->runner.~unique_ptr();
  type->tp_free(self);
  Py_DECREF(type);
}

PyObject* runner_close(PyObject* self, PyObject*) {
  auto* obj = reinterpret_cast<runner_object*>(self);
  obj->runner->close();
  Py_RETURN_NONE;
}

PyObject* runner_is_closed(PyObject* self, PyObject*) {
  auto* obj = reinterpret_cast<runner_object*>(self);
  return PyBool_FromLong(obj->runner->is_closed());
}

PyMethodDef runnerMethods[] = {
    {"close",
     runner_close,
     METH_NOARGS,
     "Stop accepting new futures. Must be called when the runner callable "
     "can no longer start tasks."},
    {"is_closed", runner_is_closed, METH_NOARGS, "Whether close() was called."},
    {nullptr, nullptr, 0, nullptr}};

PyMemberDef runnerMembers[] = {
    {"__weaklistoffset__",
     T_PYSSIZET,
     offsetof(runner_object, weakreflist),
     READONLY,
     nullptr},
    {nullptr, 0, 0, 0, nullptr}};

PyType_Slot runnerSlots[] = {
    {Py_tp_new, reinterpret_cast<void*>(&runner_new)},
    {Py_tp_dealloc, reinterpret_cast<void*>(&runner_dealloc)},
    {Py_tp_methods, runnerMethods},
    {Py_tp_members, runnerMembers},
    {Py_tp_doc,
     const_cast<char*>("Runner(runner, /)\n\n"
                       "Starts Python tasks on behalf of native futures.")},
    {0, nullptr}};

PyType_Spec runnerSpec = {
    "_pyfuture.Runner",
    sizeof(runner_object),
    0,
    Py_TPFLAGS_DEFAULT,
    runnerSlots};

// Creates the heap types on first use. Callers hold the GIL.
bool ensure_types() {
  if (completionHandleType == nullptr) {
    completionHandleType =
        reinterpret_cast<PyTypeObject*>(PyType_FromSpec(&completionHandleSpec));
    if (completionHandleType == nullptr) {
      return false;
    }
  }
  if (runnerType == nullptr) {
    runnerType = reinterpret_cast<PyTypeObject*>(PyType_FromSpec(&runnerSpec));
    if (runnerType == nullptr) {
      return false;
    }
  }
  return true;
}

PyModuleDef moduleDef = {
    PyModuleDef_HEAD_INIT,
    "_pyfuture",
    "Native futures backed by Python awaitables.",
    -1,
    nullptr,
    nullptr,
    nullptr,
    nullptr,
    nullptr};

} // namespace

std::unique_ptr<cancel_handle> runner_callable::operator()(
    gate_token& token, std::shared_ptr<py_completion_handle> handle) {
  object pyHandle = wrap_completion_handle(token, std::move(handle));
  object cancel =
      object::steal(PyObject_CallOneArg(callable_.get(), pyHandle.get()));
  if (!cancel) {
    throw error::fetch(token);
  }
  return std::make_unique<cancel_callable>(std::move(cancel));
}

std::string runner_callable::describe(gate_token&) const {
  object name = object::steal(
      PyObject_GetAttrString(callable_.get(), "__qualname__"));
  if (!name) {
    PyErr_Clear();
    name = object::steal(PyObject_Repr(callable_.get()));
  }
  if (!name) {
    PyErr_Clear();
    return "<unknown runner>";
  }
  const char* text = PyUnicode_AsUTF8(name.get());
  if (text == nullptr) {
    PyErr_Clear();
    return "<unknown runner>";
  }
  return text;
}

void cancel_callable::cancel(gate_token& token) {
  object result = object::steal(PyObject_CallNoArgs(callable_.get()));
  if (!result) {
    throw error::fetch(token);
  }
}

object wrap_completion_handle(
    gate_token& token, std::shared_ptr<py_completion_handle> handle) {
  if (!ensure_types()) {
    throw error::fetch(token);
  }
  PyObject* self = completionHandleType->tp_alloc(completionHandleType, 0);
  if (self == nullptr) {
    throw error::fetch(token);
  }
  auto* obj = reinterpret_cast<completion_handle_object*>(self);
  new (&obj->handle) std::shared_ptr<py_completion_handle>(std::move(handle));
  return object::steal(self);
}

object make_runner(gate_token& token, object callable) {
  if (!ensure_types()) {
    throw error::fetch(token);
  }
  object args = object::steal(PyTuple_Pack(1, callable.get()));
  if (!args) {
    throw error::fetch(token);
  }
  object result = object::steal(PyObject_Call(
      reinterpret_cast<PyObject*>(runnerType), args.get(), nullptr));
  if (!result) {
    throw error::fetch(token);
  }
  return result;
}

py_runner& get_runner(gate_token& token, PyObject* runner) {
  if (!ensure_types()) {
    throw error::fetch(token);
  }
  if (!PyObject_TypeCheck(runner, runnerType)) {
    throw make_error(token, PyExc_TypeError, "expected a _pyfuture.Runner");
  }
  return *reinterpret_cast<runner_object*>(runner)->runner;
}

py_foreign_future create_future(
    gate_token& token, PyObject* runner, object awaitable) {
  auto future = get_runner(token, runner).try_create_future(std::move(awaitable));
  if (!future) {
    throw runner_closed{};
  }
  return std::move(*future);
}

void register_module() {
  if (PyImport_AppendInittab("_pyfuture", &PyInit__pyfuture) == -1) {
    PYFUTURE_FATAL("could not register the _pyfuture module");
  }
}

} // namespace pyfuture::python

PyMODINIT_FUNC PyInit__pyfuture() {
  using namespace pyfuture::python;
  if (!ensure_types()) {
    return nullptr;
  }
  PyObject* module = PyModule_Create(&moduleDef);
  if (module == nullptr) {
    return nullptr;
  }
  Py_INCREF(completionHandleType);
  if (PyModule_AddObject(
          module,
          "CompletionHandle",
          reinterpret_cast<PyObject*>(completionHandleType)) < 0) {
    Py_DECREF(completionHandleType);
    Py_DECREF(module);
    return nullptr;
  }
  Py_INCREF(runnerType);
  if (PyModule_AddObject(
          module, "Runner", reinterpret_cast<PyObject*>(runnerType)) < 0) {
    Py_DECREF(runnerType);
    Py_DECREF(module);
    return nullptr;
  }
  return module;
}
