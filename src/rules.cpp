#include <textscrub/rules.hpp>
#include <textscrub/utf8.hpp>

#include <cctype>
#include <cstdio>
#include <iterator>
#include <stdexcept>

namespace textscrub {

namespace {

// Compact form of the built-in table. Declared order is rule priority.
struct RuleSpec {
  RuleCategory category;
  MatcherKind matcher;
  char32_t first;
  char32_t last;
  RuleAction action;
  const char* replacement;
  int32_t shift;
};

using C = RuleCategory;
using M = MatcherKind;
using A = RuleAction;

constexpr RuleSpec kDefaultRules[] = {
    // Markdown markers (patterns, handled by the normalizer's markdown pass)
    {C::kMarkdown, M::kEmphasis, '*', '*', A::kRemove, "", 0},
    {C::kMarkdown, M::kHeading, '#', '#', A::kRemove, "", 0},

    // Hidden / formatting characters
    {C::kInvisible, M::kScalar, 0x00AD, 0x00AD, A::kRemove, "", 0},     // soft hyphen
    {C::kInvisible, M::kScalar, 0x180E, 0x180E, A::kRemove, "", 0},     // Mongolian vowel separator
    {C::kInvisible, M::kRange, 0x200B, 0x200F, A::kRemove, "", 0},      // ZWSP, ZWNJ, ZWJ, LRM, RLM
    {C::kInvisible, M::kRange, 0x202A, 0x202E, A::kRemove, "", 0},      // bidi embeddings/overrides
    {C::kInvisible, M::kRange, 0x2060, 0x206F, A::kRemove, "", 0},      // word joiner, invisible operators
    {C::kInvisible, M::kRange, 0xFE00, 0xFE0F, A::kRemove, "", 0},      // variation selectors
    {C::kInvisible, M::kScalar, 0xFEFF, 0xFEFF, A::kRemove, "", 0},     // BOM / ZWNBSP
    {C::kInvisible, M::kRange, 0xE0000, 0xE007F, A::kRemove, "", 0},    // tag characters

    // Space separators
    {C::kWhitespace, M::kScalar, 0x00A0, 0x00A0, A::kReplace, " ", 0},  // no-break space
    {C::kWhitespace, M::kScalar, 0x1680, 0x1680, A::kReplace, " ", 0},  // Ogham space mark
    {C::kWhitespace, M::kRange, 0x2000, 0x200A, A::kReplace, " ", 0},   // en quad .. hair space
    {C::kWhitespace, M::kScalar, 0x202F, 0x202F, A::kReplace, " ", 0},  // narrow no-break space
    {C::kWhitespace, M::kScalar, 0x205F, 0x205F, A::kReplace, " ", 0},  // medium math space
    {C::kWhitespace, M::kScalar, 0x3000, 0x3000, A::kReplace, " ", 0},  // ideographic space

    // Dashes
    {C::kDash, M::kRange, 0x2012, 0x2015, A::kReplace, "-", 0},         // figure, en, em, bar
    {C::kDash, M::kScalar, 0x2212, 0x2212, A::kReplace, "-", 0},        // minus sign

    // Quotes and primes
    {C::kQuote, M::kRange, 0x2018, 0x201B, A::kReplace, "'", 0},
    {C::kQuote, M::kRange, 0x201C, 0x201F, A::kReplace, "\"", 0},
    {C::kQuote, M::kScalar, 0x2032, 0x2032, A::kReplace, "'", 0},       // prime
    {C::kQuote, M::kScalar, 0x2033, 0x2033, A::kReplace, "\"", 0},      // double prime
    {C::kQuote, M::kScalar, 0x2034, 0x2034, A::kRemove, "", 0},         // triple prime
    {C::kQuote, M::kScalar, 0x2035, 0x2035, A::kReplace, "'", 0},       // reversed prime
    {C::kQuote, M::kScalar, 0x2036, 0x2036, A::kReplace, "\"", 0},      // reversed double prime
    {C::kQuote, M::kScalar, 0x00AB, 0x00AB, A::kReplace, "\"", 0},      // left guillemet
    {C::kQuote, M::kScalar, 0x00BB, 0x00BB, A::kReplace, "\"", 0},      // right guillemet

    // Punctuation
    {C::kPunctuation, M::kScalar, 0x2026, 0x2026, A::kReplace, "...", 0},  // ellipsis
    {C::kPunctuation, M::kScalar, 0x2022, 0x2022, A::kReplace, "*", 0},    // bullet
    {C::kPunctuation, M::kScalar, 0x00B7, 0x00B7, A::kReplace, ".", 0},    // middle dot

    // Fullwidth ASCII
    {C::kFullwidth, M::kRange, 0xFF01, 0xFF5E, A::kShift, "", -0xFEE0},
};

// Emoji blocks the keyboard-only filter keeps
constexpr char32_t kEmojiRanges[][2] = {
    {0x1F600, 0x1F64F},  // emoticons
    {0x1F300, 0x1F5FF},  // misc symbols and pictographs
    {0x1F680, 0x1F6FF},  // transport and map
    {0x1F900, 0x1F9FF},  // supplemental symbols and pictographs
    {0x2700, 0x27BF},    // dingbats
    {0x1FA70, 0x1FAFF},  // symbols and pictographs extended-A
    {0x1F1E6, 0x1F1FF},  // regional indicators
    {0x2600, 0x26FF},    // misc symbols
};

bool IsCommonEmoji(char32_t cp) {
  for (const auto& range : kEmojiRanges) {
    if (cp >= range[0] && cp <= range[1]) return true;
  }
  return false;
}

SubstitutionRule FromSpec(const RuleSpec& spec) {
  SubstitutionRule rule;
  rule.category = spec.category;
  rule.matcher = spec.matcher;
  rule.first = spec.first;
  rule.last = spec.last;
  rule.action = spec.action;
  rule.replacement = spec.replacement;
  rule.shift = spec.shift;
  return rule;
}

std::string Describe(const SubstitutionRule& rule) {
  char buf[48];
  if (rule.first == rule.last) {
    std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(rule.first));
  } else {
    std::snprintf(buf, sizeof(buf), "U+%04X-U+%04X", static_cast<unsigned>(rule.first),
                  static_cast<unsigned>(rule.last));
  }
  return std::string(CategoryName(rule.category)) + " rule " + buf;
}

bool ParseHex(std::string_view text, char32_t* out) {
  if (text.size() >= 2 && (text[0] == 'U' || text[0] == 'u') && text[1] == '+') {
    text.remove_prefix(2);
  } else if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
  }
  if (text.empty() || text.size() > 6) return false;

  char32_t value = 0;
  for (const char c : text) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    value = value * 16 + static_cast<char32_t>(lower <= '9' ? lower - '0' : lower - 'a' + 10);
  }
  if (value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) return false;
  *out = value;
  return true;
}

std::string_view TrimView(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

}  // namespace

// --- SubstitutionRule ---

bool SubstitutionRule::Matches(char32_t cp) const {
  switch (matcher) {
    case MatcherKind::kScalar:
    case MatcherKind::kRange:
      return cp >= first && cp <= last;
    case MatcherKind::kNonKeyboard:
      return cp >= 0x80 && !internal::IsInvalidUnit(cp) && !IsCommonEmoji(cp);
    case MatcherKind::kEmphasis:
    case MatcherKind::kHeading:
      return false;
  }
  return false;
}

void SubstitutionRule::Apply(char32_t cp, std::string* out) const {
  switch (action) {
    case RuleAction::kReplace:
      out->append(replacement);
      break;
    case RuleAction::kRemove:
      break;
    case RuleAction::kShift:
      internal::AppendUTF8(static_cast<char32_t>(static_cast<int64_t>(cp) + shift), out);
      break;
  }
}

const char* CategoryName(RuleCategory category) {
  switch (category) {
    case RuleCategory::kMarkdown: return "markdown";
    case RuleCategory::kInvisible: return "invisible";
    case RuleCategory::kWhitespace: return "whitespace";
    case RuleCategory::kDash: return "dash";
    case RuleCategory::kQuote: return "quote";
    case RuleCategory::kPunctuation: return "punctuation";
    case RuleCategory::kFullwidth: return "fullwidth";
    case RuleCategory::kKeyboardOnly: return "keyboard_only";
    case RuleCategory::kCustom: return "custom";
  }
  return "unknown";
}

SubstitutionRule ReplaceRule(RuleCategory category, char32_t cp, std::string replacement) {
  SubstitutionRule rule;
  rule.category = category;
  rule.matcher = MatcherKind::kScalar;
  rule.first = cp;
  rule.last = cp;
  rule.action = RuleAction::kReplace;
  rule.replacement = std::move(replacement);
  return rule;
}

SubstitutionRule RemoveRule(RuleCategory category, char32_t first, char32_t last) {
  SubstitutionRule rule;
  rule.category = category;
  rule.matcher = (first == last) ? MatcherKind::kScalar : MatcherKind::kRange;
  rule.first = first;
  rule.last = last;
  rule.action = RuleAction::kRemove;
  return rule;
}

std::vector<SubstitutionRule> DefaultRules(bool keyboard_only) {
  std::vector<SubstitutionRule> rules;
  rules.reserve(std::size(kDefaultRules) + 1);
  for (const auto& spec : kDefaultRules) {
    rules.push_back(FromSpec(spec));
  }
  if (keyboard_only) {
    SubstitutionRule rule;
    rule.category = RuleCategory::kKeyboardOnly;
    rule.matcher = MatcherKind::kNonKeyboard;
    rule.first = 0x80;
    rule.last = 0x10FFFF;
    rule.action = RuleAction::kRemove;
    rules.push_back(std::move(rule));
  }
  return rules;
}

bool ParseCodepointRange(std::string_view text, char32_t* first, char32_t* last) {
  text = TrimView(text);
  // A '-' after the first digit separates the bounds
  const size_t dash = text.find('-', 1);
  char32_t lo = 0;
  char32_t hi = 0;
  if (dash == std::string_view::npos) {
    if (!ParseHex(text, &lo)) return false;
    hi = lo;
  } else {
    if (!ParseHex(TrimView(text.substr(0, dash)), &lo) ||
        !ParseHex(TrimView(text.substr(dash + 1)), &hi)) {
      return false;
    }
  }
  if (lo > hi) return false;
  *first = lo;
  *last = hi;
  return true;
}

// --- RuleSet ---

RuleSet::RuleSet() : RuleSet(DefaultRules()) {}

RuleSet::RuleSet(std::vector<SubstitutionRule> rules) : rules_(std::move(rules)) {
  for (size_t i = 0; i < rules_.size(); ++i) {
    const auto& rule = rules_[i];
    if (rule.IsCharacterRule()) {
      character_rules_.push_back(i);
    } else if (rule.matcher == MatcherKind::kEmphasis) {
      strips_emphasis_ = true;
    } else if (rule.matcher == MatcherKind::kHeading) {
      strips_headings_ = true;
    }
  }
  Validate();
}

const SubstitutionRule* RuleSet::Find(char32_t cp) const {
  for (const size_t index : character_rules_) {
    const auto& rule = rules_[index];
    if (rule.Matches(cp)) {
      return &rule;
    }
  }
  return nullptr;
}

void RuleSet::Validate() const {
  for (const auto& rule : rules_) {
    const std::string name = Describe(rule);

    if (rule.first > rule.last || rule.last > 0x10FFFF) {
      throw std::invalid_argument(name + ": invalid code point range");
    }
    if (rule.matcher == MatcherKind::kScalar && rule.first != rule.last) {
      throw std::invalid_argument(name + ": scalar matcher with a range");
    }
    if ((rule.matcher == MatcherKind::kEmphasis && rule.first != '*') ||
        (rule.matcher == MatcherKind::kHeading && rule.first != '#')) {
      throw std::invalid_argument(name + ": markdown pattern bound to the wrong marker");
    }
    if (!rule.IsCharacterRule()) {
      continue;
    }

    // Collect every code point this rule can emit
    std::vector<char32_t> outputs;
    if (rule.action == RuleAction::kReplace) {
      if (rule.replacement.empty()) {
        throw std::invalid_argument(name + ": empty replacement (use a remove rule)");
      }
      for (const auto& unit : internal::Decode(rule.replacement)) {
        if (internal::IsInvalidUnit(unit.cp)) {
          throw std::invalid_argument(name + ": replacement is not valid UTF-8");
        }
        outputs.push_back(unit.cp);
      }
      // Markers and line breaks inside longer replacements would change the
      // markdown structure on a second pass
      if (rule.replacement != "*" && rule.replacement != "#" &&
          rule.replacement.find_first_of("*#\r\n") != std::string::npos) {
        throw std::invalid_argument(name + ": replacement contains a markdown marker or line break");
      }
    } else if (rule.action == RuleAction::kShift) {
      if (rule.matcher == MatcherKind::kNonKeyboard) {
        throw std::invalid_argument(name + ": class rules cannot shift");
      }
      const int64_t lo = static_cast<int64_t>(rule.first) + rule.shift;
      const int64_t hi = static_cast<int64_t>(rule.last) + rule.shift;
      if (lo < 0 || hi > 0x10FFFF || (hi >= 0xD800 && lo <= 0xDFFF)) {
        throw std::invalid_argument(name + ": shift leaves the Unicode scalar range");
      }
      for (int64_t cp = lo; cp <= hi; ++cp) {
        if (cp == '\n' || cp == '\r') {
          throw std::invalid_argument(name + ": shift produces a line break");
        }
        outputs.push_back(static_cast<char32_t>(cp));
      }
    }

    for (const char32_t out : outputs) {
      if (const SubstitutionRule* again = Find(out)) {
        throw std::invalid_argument(name + ": output is matched again by " + Describe(*again));
      }
    }
  }
}

RuleSet MakeRuleSet(const RuleOptions& options) {
  std::vector<SubstitutionRule> rules;
  for (auto& rule : DefaultRules(options.keyboard_only)) {
    if (!options.strip_markdown && rule.category == RuleCategory::kMarkdown) {
      continue;
    }
    rules.push_back(std::move(rule));
  }

  for (const auto& entry : options.remove_codepoints) {
    char32_t first = 0;
    char32_t last = 0;
    if (!ParseCodepointRange(entry, &first, &last)) {
      throw std::invalid_argument("invalid code point or range: '" + entry + "'");
    }
    rules.push_back(RemoveRule(RuleCategory::kCustom, first, last));
  }
  return RuleSet(std::move(rules));
}

}  // namespace textscrub
