/**
 * Main pybind11 module definition for textscrub.
 */

#include <pybind11/pybind11.h>
#include <textscrub/version.hpp>

#include "exceptions.hpp"
#include "text_bindings.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_textscrub, m) {
  m.doc() = R"doc(
textscrub: canonical plain text and a character diff explaining it.

Basic usage:
    import textscrub

    cleaned = textscrub.normalize("“Hello—world”")   # '"Hello-world"'
    for seg in textscrub.diff("“Hello”", cleaned):
        print(seg.type, seg.text)

    cleaned, segments = textscrub.clean("**bold**")
)doc";

  // Register exceptions first
  textscrub::python::RegisterExceptions(m);

  textscrub::python::BindText(m);

  // Version info
  m.attr("__version__") = textscrub::Version();
}
