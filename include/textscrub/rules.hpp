#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace textscrub {

/** Rule families, in the order the default table declares them. */
enum class RuleCategory : uint8_t {
  kMarkdown,      // Emphasis markers and heading prefixes
  kInvisible,     // Zero-width, bidi controls, variation selectors, tags
  kWhitespace,    // Unicode space separators -> ' '
  kDash,          // Em/en dashes and friends -> '-'
  kQuote,         // Smart quotes and primes -> ' or "
  kPunctuation,   // Ellipsis, bullet, middle dot
  kFullwidth,     // U+FF01-FF5E -> ASCII
  kKeyboardOnly,  // Anything non-ASCII that is not a common emoji
  kCustom         // Caller-supplied
};

/** What a rule matches. */
enum class MatcherKind : uint8_t {
  kScalar,       // One code point (first == last)
  kRange,        // Inclusive code point range [first, last]
  kEmphasis,     // Markdown '*' delimiter runs (pattern)
  kHeading,      // Markdown '#' line prefix (pattern)
  kNonKeyboard   // Class: non-ASCII outside the common emoji blocks
};

/** What happens to a match. */
enum class RuleAction : uint8_t {
  kReplace,  // Emit `replacement`
  kRemove,   // Emit nothing
  kShift     // Emit the code point moved by `shift`
};

/**
 * One substitution rule. Plain data so the table can be listed, tested and
 * extended without touching the engine.
 */
struct SubstitutionRule {
  RuleCategory category = RuleCategory::kCustom;
  MatcherKind matcher = MatcherKind::kScalar;
  char32_t first = 0;
  char32_t last = 0;
  RuleAction action = RuleAction::kRemove;
  std::string replacement;  // kReplace only
  int32_t shift = 0;        // kShift only

  /** True for rules matched one code point at a time. */
  bool IsCharacterRule() const {
    return matcher == MatcherKind::kScalar || matcher == MatcherKind::kRange ||
           matcher == MatcherKind::kNonKeyboard;
  }

  /** Whether this character rule matches `cp`. Always false for markdown patterns. */
  bool Matches(char32_t cp) const;

  /** Append the image of `cp` (which must match) to `out`. */
  void Apply(char32_t cp, std::string* out) const;
};

const char* CategoryName(RuleCategory category);

/** Helpers for building tables. */
SubstitutionRule ReplaceRule(RuleCategory category, char32_t cp, std::string replacement);
SubstitutionRule RemoveRule(RuleCategory category, char32_t first, char32_t last);

/**
 * The built-in table in declared order: markdown, invisible, whitespace,
 * dashes, quotes, punctuation, fullwidth. When `keyboard_only` is set the
 * keyboard-only class rule is appended last.
 */
std::vector<SubstitutionRule> DefaultRules(bool keyboard_only = false);

/**
 * Parse "U+2728" or "U+2700-U+27BF" (the "U+" prefix is optional, hex is
 * case-insensitive). Returns false if the text is not a valid scalar or range.
 */
bool ParseCodepointRange(std::string_view text, char32_t* first, char32_t* last);

/**
 * A validated, immutable ordered rule list.
 *
 * Construction rejects malformed rules and any rule whose output contains a
 * code point that a character rule of the same set would match again, which
 * is what keeps normalization idempotent.
 */
class RuleSet {
 public:
  /** The default table (DefaultRules()). */
  RuleSet();

  /**
   * @throws std::invalid_argument on malformed or self-feeding rules.
   */
  explicit RuleSet(std::vector<SubstitutionRule> rules);

  /**
   * First character rule (in declared order) matching `cp`, or nullptr.
   */
  const SubstitutionRule* Find(char32_t cp) const;

  bool StripsEmphasis() const { return strips_emphasis_; }
  bool StripsHeadings() const { return strips_headings_; }

  const std::vector<SubstitutionRule>& rules() const { return rules_; }
  size_t size() const { return rules_.size(); }

 private:
  void Validate() const;

  std::vector<SubstitutionRule> rules_;
  std::vector<size_t> character_rules_;  // Indexes into rules_
  bool strips_emphasis_ = false;
  bool strips_headings_ = false;
};

/**
 * The knobs a deployment turns on the default table.
 */
struct RuleOptions {
  bool keyboard_only = false;
  bool strip_markdown = true;
  std::vector<std::string> remove_codepoints;  // "U+XXXX" or "U+XXXX-U+YYYY"
};

/**
 * Default table adjusted by `options`; custom removals go last.
 * @throws std::invalid_argument on a malformed remove_codepoints entry.
 */
RuleSet MakeRuleSet(const RuleOptions& options);

}  // namespace textscrub
