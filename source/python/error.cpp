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
#include <pyfuture/python/error.hpp>

#include <exception>

namespace pyfuture::python {

namespace {

std::string to_utf8(PyObject* obj) {
  object text = object::steal(PyObject_Str(obj));
  if (!text) {
    PyErr_Clear();
    return "<unprintable>";
  }
  Py_ssize_t size = 0;
  const char* data = PyUnicode_AsUTF8AndSize(text.get(), &size);
  if (data == nullptr) {
    PyErr_Clear();
    return "<unprintable>";
  }
  return std::string(data, static_cast<std::size_t>(size));
}

std::string format_traceback(PyObject* value) {
  object tb = object::steal(PyException_GetTraceback(value));
  if (!tb) {
    return {};
  }
  object module = object::steal(PyImport_ImportModule("traceback"));
  if (!module) {
    PyErr_Clear();
    return {};
  }
  object lines = object::steal(
      PyObject_CallMethod(module.get(), "format_tb", "O", tb.get()));
  if (!lines) {
    PyErr_Clear();
    return {};
  }
  object separator = object::steal(PyUnicode_FromString(""));
  object joined = object::steal(
      separator ? PyUnicode_Join(separator.get(), lines.get()) : nullptr);
  if (!joined) {
    PyErr_Clear();
    return {};
  }
  return "Traceback (most recent call last):\n" + to_utf8(joined.get());
}

std::string describe(PyObject* value) {
  std::string text = Py_TYPE(value)->tp_name;
  text += ": ";
  text += to_utf8(value);
  std::string traceback = format_traceback(value);
  if (!traceback.empty()) {
    text += "\n";
    text += traceback;
  }
  return text;
}

} // namespace

error error::fetch(gate_token& token) {
  PyObject* type = nullptr;
  PyObject* value = nullptr;
  PyObject* traceback = nullptr;
  PyErr_Fetch(&type, &value, &traceback);
  if (type == nullptr) {
    PyErr_SetString(
        PyExc_RuntimeError, "native code expected a Python exception");
    PyErr_Fetch(&type, &value, &traceback);
  }
  PyErr_NormalizeException(&type, &value, &traceback);
  if (traceback != nullptr && value != nullptr) {
    PyException_SetTraceback(value, traceback);
  }
  Py_XDECREF(type);
  Py_XDECREF(traceback);
  return from_value(token, object::steal(value));
}

error error::from_value(gate_token&, object value) {
  std::string text = value ? describe(value.get()) : "unknown Python error";
  return error{
      std::move(text), std::make_shared<const object>(std::move(value))};
}

void error::restore(gate_token&) const noexcept {
  PyObject* value = value_->get();
  if (value == nullptr) {
    PyErr_SetString(PyExc_RuntimeError, what());
    return;
  }
  PyErr_SetObject(reinterpret_cast<PyObject*>(Py_TYPE(value)), value);
}

error make_error(gate_token& token, PyObject* type, const char* message) {
  PyErr_SetString(type, message);
  return error::fetch(token);
}

void set_error_from_current_exception(gate_token& token) noexcept {
  try {
    throw;
  } catch (const error& ex) {
    ex.restore(token);
  } catch (const std::exception& ex) {
    PyErr_SetString(PyExc_RuntimeError, ex.what());
  } catch (...) {
    PyErr_SetString(PyExc_RuntimeError, "unknown native exception");
  }
}

} // namespace pyfuture::python
