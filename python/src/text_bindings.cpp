/**
 * Normalizer and diff bindings for textscrub Python bindings.
 */

#include "text_bindings.hpp"
#include "exceptions.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <textscrub/diff.hpp>
#include <textscrub/normalize.hpp>
#include <textscrub/rules.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;
using namespace pybind11::literals;

namespace textscrub::python {

namespace {

Normalizer MakeNormalizer(bool keyboard_only, bool strip_markdown,
                          std::vector<std::string> remove_codepoints) {
  RuleOptions options;
  options.keyboard_only = keyboard_only;
  options.strip_markdown = strip_markdown;
  options.remove_codepoints = std::move(remove_codepoints);
  try {
    return Normalizer(MakeRuleSet(options));
  } catch (const std::invalid_argument& e) {
    RaiseInvalidRule(e.what());
  }
}

// The four built-in configurations, built once
const Normalizer& Builtin(bool keyboard_only, bool strip_markdown) {
  static const auto kNormalizers = [] {
    std::vector<Normalizer> normalizers;
    for (const bool keyboard : {false, true}) {
      for (const bool markdown : {false, true}) {
        RuleOptions options;
        options.keyboard_only = keyboard;
        options.strip_markdown = markdown;
        normalizers.emplace_back(MakeRuleSet(options));
      }
    }
    return normalizers;
  }();
  return kNormalizers[(keyboard_only ? 2 : 0) + (strip_markdown ? 1 : 0)];
}

std::vector<DiffSegment> RunDiff(const std::string& original, const std::string& canonical,
                                 uint64_t max_alignment_cells, bool lines) {
  DiffOptions options;
  options.max_alignment_cells = max_alignment_cells;
  options.granularity = lines ? DiffGranularity::kLine : DiffGranularity::kCharacter;

  DiffResult result;
  {
    py::gil_scoped_release release;
    result = Diff(original, canonical, options);
  }
  CheckDiffResult(result);
  return std::move(result.segments);
}

}  // namespace

void BindText(py::module_& m) {
  py::enum_<DiffKind>(m, "DiffKind")
      .value("EQUAL", DiffKind::kEqual)
      .value("INSERT", DiffKind::kInsert)
      .value("DELETE", DiffKind::kDelete);

  py::class_<DiffSegment>(m, "DiffSegment", R"doc(
A maximal run of text that is kept, inserted or deleted.
)doc")
      .def(py::init([](DiffKind kind, std::string text) {
             return DiffSegment{kind, std::move(text)};
           }),
           "kind"_a, "text"_a)
      .def_readonly("kind", &DiffSegment::kind)
      .def_readonly("text", &DiffSegment::text)
      .def_property_readonly("type",
                             [](const DiffSegment& s) { return DiffKindName(s.kind); })
      .def("__eq__", [](const DiffSegment& a, const DiffSegment& b) { return a == b; })
      .def("__repr__", [](const DiffSegment& s) {
        return std::string("DiffSegment(") + DiffKindName(s.kind) + ", " +
               py::repr(py::str(s.text)).cast<std::string>() + ")";
      });

  py::class_<Normalizer, std::shared_ptr<Normalizer>>(m, "Normalizer", R"doc(
Reusable normalizer with a fixed rule set.

    n = textscrub.Normalizer(remove_codepoints=["U+2728"])
    n.normalize("done ✨")  # "done "
)doc")
      .def(py::init([](bool keyboard_only, bool strip_markdown,
                       std::vector<std::string> remove_codepoints) {
             return std::make_shared<Normalizer>(
                 MakeNormalizer(keyboard_only, strip_markdown, std::move(remove_codepoints)));
           }),
           "keyboard_only"_a = false, "strip_markdown"_a = true,
           "remove_codepoints"_a = std::vector<std::string>())
      .def(
          "normalize",
          [](const Normalizer& self, const std::string& text) {
            py::gil_scoped_release release;
            return self.Normalize(text);
          },
          "text"_a)
      .def_property_readonly("rule_count",
                             [](const Normalizer& self) { return self.rules().size(); });

  m.def(
      "normalize",
      [](const std::string& text, bool keyboard_only, bool strip_markdown) {
        const Normalizer& normalizer = Builtin(keyboard_only, strip_markdown);
        py::gil_scoped_release release;
        return normalizer.Normalize(text);
      },
      "text"_a, "keyboard_only"_a = false, "strip_markdown"_a = true,
      "Return the canonical plain-text form of text.");

  m.def("diff", &RunDiff, "original"_a, "canonical"_a,
        "max_alignment_cells"_a = DiffOptions().max_alignment_cells, "lines"_a = false,
        "Align original against canonical. Raises ResourceLimitError when the "
        "alignment exceeds max_alignment_cells (0 = unlimited).");

  m.def(
      "clean",
      [](const std::string& text, bool keyboard_only, bool strip_markdown,
         uint64_t max_alignment_cells) {
        std::string cleaned;
        {
          py::gil_scoped_release release;
          cleaned = Builtin(keyboard_only, strip_markdown).Normalize(text);
        }
        auto segments = RunDiff(text, cleaned, max_alignment_cells, false);
        return py::make_tuple(cleaned, segments);
      },
      "text"_a, "keyboard_only"_a = false, "strip_markdown"_a = true,
      "max_alignment_cells"_a = DiffOptions().max_alignment_cells,
      "Return (cleaned_text, segments).");
}

}  // namespace textscrub::python
