/**
 * Exception handling for textscrub Python bindings.
 *
 * Maps DiffResult failures and rule errors to Python exceptions.
 */

#include "exceptions.hpp"

#include <pybind11/pybind11.h>

namespace py = pybind11;

namespace textscrub::python {

// Static exception type pointers
static PyObject* TextscrubError = nullptr;
static PyObject* ResourceLimitError = nullptr;
static PyObject* InvalidRuleError = nullptr;

void RegisterExceptions(py::module_& m) {
  // Base exception
  TextscrubError =
      PyErr_NewException("textscrub.TextscrubError", PyExc_Exception, nullptr);
  py::setattr(m, "TextscrubError", py::handle(TextscrubError));

  // Derived exceptions
  ResourceLimitError =
      PyErr_NewException("textscrub.ResourceLimitError", TextscrubError, nullptr);
  py::setattr(m, "ResourceLimitError", py::handle(ResourceLimitError));

  InvalidRuleError =
      PyErr_NewException("textscrub.InvalidRuleError", TextscrubError, nullptr);
  py::setattr(m, "InvalidRuleError", py::handle(InvalidRuleError));
}

void CheckDiffResult(const DiffResult& result) {
  if (result.success) {
    return;
  }

  if (result.resource_limit_exceeded) {
    PyErr_SetString(ResourceLimitError, result.error_message.c_str());
    throw py::error_already_set();
  }

  PyErr_SetString(TextscrubError, result.error_message.c_str());
  throw py::error_already_set();
}

void RaiseInvalidRule(const std::string& message) {
  PyErr_SetString(InvalidRuleError, message.c_str());
  throw py::error_already_set();
}

}  // namespace textscrub::python
