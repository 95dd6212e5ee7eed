/**
 * Exception handling for textscrub Python bindings.
 */

#pragma once

#include <pybind11/pybind11.h>
#include <textscrub/diff.hpp>

#include <string>

namespace textscrub::python {

/**
 * Register exception types with the Python module.
 */
void RegisterExceptions(pybind11::module_& m);

/**
 * Raise ResourceLimitError (or TextscrubError) if the diff did not succeed.
 */
void CheckDiffResult(const DiffResult& result);

/**
 * Raise InvalidRuleError with `message`.
 */
[[noreturn]] void RaiseInvalidRule(const std::string& message);

}  // namespace textscrub::python
