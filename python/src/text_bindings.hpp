/**
 * Normalizer and diff bindings for textscrub Python bindings.
 */

#pragma once

#include <pybind11/pybind11.h>

namespace textscrub::python {

/**
 * Bind DiffKind, DiffSegment, Normalizer and the module-level
 * normalize/diff/clean functions.
 */
void BindText(pybind11::module_& m);

}  // namespace textscrub::python
