#pragma once

#include <textscrub/rules.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace textscrub {

/**
 * Maps text to its canonical plain-text form by applying a RuleSet in one
 * left-to-right pass.
 *
 * Markdown markers are resolved first, against the image each character
 * will have after the character rules (so a fullwidth asterisk counts as
 * '*' and a zero-width space is skipped). Character rules then map or drop
 * each remaining code point; unmatched code points and invalid UTF-8 bytes
 * pass through unchanged.
 *
 * Normalize(Normalize(x)) == Normalize(x) for every RuleSet that
 * constructs successfully.
 *
 * Immutable after construction; safe to share across threads.
 */
class Normalizer {
 public:
  Normalizer() = default;
  explicit Normalizer(RuleSet rules) : rules_(std::move(rules)) {}

  /**
   * Normalize text. Total: never fails, empty input gives empty output.
   */
  std::string Normalize(std::string_view input) const;

  const RuleSet& rules() const { return rules_; }

 private:
  RuleSet rules_;
};

/**
 * Normalize with the default rule table.
 */
std::string Normalize(std::string_view input);

}  // namespace textscrub
