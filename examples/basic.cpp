#include <textscrub/diff.hpp>
#include <textscrub/normalize.hpp>
#include <textscrub/rules.hpp>

#include <iostream>
#include <stdexcept>

int main() {
  const std::string original = "\xE2\x80\x9CHello\xE2\x80\x94world\xE2\x80\x9D **really**\xE2\x80\xA6";

  std::string cleaned = textscrub::Normalize(original);
  std::cout << "cleaned=" << cleaned << "\n";

  auto result = textscrub::Diff(original, cleaned);
  if (!result.success) {
    std::cerr << "Diff failed: " << result.error_message << "\n";
    return 1;
  }
  for (const auto& segment : result.segments) {
    std::cout << textscrub::DiffKindName(segment.kind) << " [" << segment.text << "]\n";
  }

  // A tiny budget refuses the alignment instead of running it.
  textscrub::DiffOptions tight;
  tight.max_alignment_cells = 4;
  result = textscrub::Diff(original, cleaned, tight);
  if (result.resource_limit_exceeded) {
    std::cout << "refused: " << result.error_message << "\n";
  }

  // Custom removals are validated together with the built-in table.
  textscrub::RuleOptions options;
  options.remove_codepoints = {"U+2728", "U+1F916"};
  try {
    textscrub::Normalizer normalizer(textscrub::MakeRuleSet(options));
    std::cout << normalizer.Normalize("done \xE2\x9C\xA8") << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "Bad rules: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
