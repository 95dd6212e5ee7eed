// Unit tests for textscrub/rules.hpp
// Tests: Default rule table, RuleSet lookup and validation, code point parsing

#include <gtest/gtest.h>

#include <textscrub/rules.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace textscrub {
namespace {

// =============================================================================
// Default Table Tests
// =============================================================================

class DefaultRulesTest : public ::testing::Test {};

TEST_F(DefaultRulesTest, CategoriesAppearInDeclaredOrder) {
  const auto rules = DefaultRules();
  ASSERT_FALSE(rules.empty());

  std::vector<RuleCategory> order;
  for (const auto& rule : rules) {
    if (order.empty() || order.back() != rule.category) order.push_back(rule.category);
  }
  const std::vector<RuleCategory> expected = {
      RuleCategory::kMarkdown, RuleCategory::kInvisible,   RuleCategory::kWhitespace,
      RuleCategory::kDash,     RuleCategory::kQuote,       RuleCategory::kPunctuation,
      RuleCategory::kFullwidth};
  EXPECT_EQ(order, expected);
}

TEST_F(DefaultRulesTest, MarkdownPatternsComeFirst) {
  const auto rules = DefaultRules();
  ASSERT_GE(rules.size(), 2u);
  EXPECT_EQ(rules[0].matcher, MatcherKind::kEmphasis);
  EXPECT_EQ(rules[1].matcher, MatcherKind::kHeading);
  EXPECT_FALSE(rules[0].IsCharacterRule());
  EXPECT_FALSE(rules[1].IsCharacterRule());
}

TEST_F(DefaultRulesTest, KeyboardOnlyRuleIsAppendedLast) {
  const auto plain = DefaultRules(false);
  const auto keyboard = DefaultRules(true);
  ASSERT_EQ(keyboard.size(), plain.size() + 1);
  EXPECT_EQ(keyboard.back().category, RuleCategory::kKeyboardOnly);
  EXPECT_EQ(keyboard.back().matcher, MatcherKind::kNonKeyboard);
}

TEST_F(DefaultRulesTest, DefaultTableValidates) {
  EXPECT_NO_THROW(RuleSet rules(DefaultRules(false)));
  EXPECT_NO_THROW(RuleSet rules(DefaultRules(true)));
}

TEST_F(DefaultRulesTest, CategoryNames) {
  EXPECT_STREQ(CategoryName(RuleCategory::kInvisible), "invisible");
  EXPECT_STREQ(CategoryName(RuleCategory::kKeyboardOnly), "keyboard_only");
  EXPECT_STREQ(CategoryName(RuleCategory::kCustom), "custom");
}

// =============================================================================
// RuleSet::Find Tests
// =============================================================================

class RuleSetFindTest : public ::testing::Test {
 protected:
  RuleSet rules_;

  std::string ImageOf(char32_t cp) {
    const SubstitutionRule* rule = rules_.Find(cp);
    if (!rule) return "<none>";
    std::string out;
    rule->Apply(cp, &out);
    return out;
  }
};

TEST_F(RuleSetFindTest, AsciiIsNeverMatched) {
  for (char32_t cp = 0; cp < 0x80; ++cp) {
    EXPECT_EQ(rules_.Find(cp), nullptr) << "U+" << std::hex << static_cast<uint32_t>(cp);
  }
}

TEST_F(RuleSetFindTest, InvisibleCharactersAreRemoved) {
  for (char32_t cp : {0x00AD, 0x180E, 0x200B, 0x200D, 0x200F, 0x202A, 0x202E, 0x2060,
                      0x206F, 0xFE00, 0xFE0F, 0xFEFF, 0xE0001, 0xE007F}) {
    EXPECT_EQ(ImageOf(cp), "") << "U+" << std::hex << static_cast<uint32_t>(cp);
  }
}

TEST_F(RuleSetFindTest, SpaceSeparatorsBecomeSpace) {
  for (char32_t cp : {0x00A0, 0x1680, 0x2000, 0x2005, 0x200A, 0x202F, 0x205F, 0x3000}) {
    EXPECT_EQ(ImageOf(cp), " ") << "U+" << std::hex << static_cast<uint32_t>(cp);
  }
}

TEST_F(RuleSetFindTest, DashesBecomeHyphen) {
  for (char32_t cp : {0x2012, 0x2013, 0x2014, 0x2015, 0x2212}) {
    EXPECT_EQ(ImageOf(cp), "-");
  }
  // Hyphen U+2010 and non-breaking hyphen U+2011 are not in the table
  EXPECT_EQ(ImageOf(0x2010), "<none>");
}

TEST_F(RuleSetFindTest, QuotesAndPrimes) {
  EXPECT_EQ(ImageOf(0x2018), "'");
  EXPECT_EQ(ImageOf(0x201B), "'");
  EXPECT_EQ(ImageOf(0x201C), "\"");
  EXPECT_EQ(ImageOf(0x201F), "\"");
  EXPECT_EQ(ImageOf(0x2032), "'");
  EXPECT_EQ(ImageOf(0x2033), "\"");
  EXPECT_EQ(ImageOf(0x2034), "");
  EXPECT_EQ(ImageOf(0x2035), "'");
  EXPECT_EQ(ImageOf(0x2036), "\"");
  EXPECT_EQ(ImageOf(0x00AB), "\"");
  EXPECT_EQ(ImageOf(0x00BB), "\"");
}

TEST_F(RuleSetFindTest, Punctuation) {
  EXPECT_EQ(ImageOf(0x2026), "...");
  EXPECT_EQ(ImageOf(0x2022), "*");
  EXPECT_EQ(ImageOf(0x00B7), ".");
}

TEST_F(RuleSetFindTest, FullwidthShiftsToAscii) {
  EXPECT_EQ(ImageOf(0xFF01), "!");
  EXPECT_EQ(ImageOf(0xFF21), "A");
  EXPECT_EQ(ImageOf(0xFF41), "a");
  EXPECT_EQ(ImageOf(0xFF5E), "~");
  EXPECT_EQ(ImageOf(0xFF5F), "<none>");
  EXPECT_EQ(ImageOf(0xFF00), "<none>");
}

TEST_F(RuleSetFindTest, OtherScalarsPassThrough) {
  EXPECT_EQ(rules_.Find(0x00E9), nullptr);   // e acute
  EXPECT_EQ(rules_.Find(0x20AC), nullptr);   // euro
  EXPECT_EQ(rules_.Find(0x1F600), nullptr);  // emoji
  EXPECT_EQ(rules_.Find(0x4E2D), nullptr);   // CJK
}

TEST_F(RuleSetFindTest, KeyboardOnlyKeepsEmojiBlocks) {
  RuleSet keyboard(DefaultRules(true));
  EXPECT_EQ(keyboard.Find(0x1F60A), nullptr);  // smiling face
  EXPECT_EQ(keyboard.Find(0x1F468), nullptr);  // man
  EXPECT_EQ(keyboard.Find(0x2764), nullptr);   // heavy heart (dingbats)
  EXPECT_EQ(keyboard.Find(0x1F1FA), nullptr);  // regional indicator U
  EXPECT_EQ(keyboard.Find(0x2600), nullptr);   // misc symbols
  EXPECT_EQ(keyboard.Find('a'), nullptr);

  ASSERT_NE(keyboard.Find(0x20AC), nullptr);
  EXPECT_EQ(keyboard.Find(0x20AC)->category, RuleCategory::kKeyboardOnly);
  ASSERT_NE(keyboard.Find(0x00A9), nullptr);
  EXPECT_EQ(keyboard.Find(0x00A9)->category, RuleCategory::kKeyboardOnly);

  // Earlier, more specific rules still win
  ASSERT_NE(keyboard.Find(0x2014), nullptr);
  EXPECT_EQ(keyboard.Find(0x2014)->category, RuleCategory::kDash);
}

TEST_F(RuleSetFindTest, MarkdownFlags) {
  EXPECT_TRUE(rules_.StripsEmphasis());
  EXPECT_TRUE(rules_.StripsHeadings());

  RuleOptions options;
  options.strip_markdown = false;
  RuleSet plain = MakeRuleSet(options);
  EXPECT_FALSE(plain.StripsEmphasis());
  EXPECT_FALSE(plain.StripsHeadings());
  EXPECT_EQ(plain.size(), rules_.size() - 2);
}

// =============================================================================
// Validation Tests
// =============================================================================

class RuleSetValidationTest : public ::testing::Test {
 protected:
  static std::vector<SubstitutionRule> WithDefaults(SubstitutionRule extra) {
    auto rules = DefaultRules();
    rules.push_back(std::move(extra));
    return rules;
  }
};

TEST_F(RuleSetValidationTest, RejectsInvertedRange) {
  EXPECT_THROW(RuleSet rules({RemoveRule(RuleCategory::kCustom, 0x2100, 0x20FF)}),
               std::invalid_argument);
}

TEST_F(RuleSetValidationTest, RejectsRangeBeyondUnicode) {
  EXPECT_THROW(RuleSet rules({RemoveRule(RuleCategory::kCustom, 0x10FFFF, 0x110000)}),
               std::invalid_argument);
}

TEST_F(RuleSetValidationTest, RejectsScalarWithRange) {
  SubstitutionRule rule = RemoveRule(RuleCategory::kCustom, 0x2100, 0x2101);
  rule.matcher = MatcherKind::kScalar;
  EXPECT_THROW(RuleSet rules({rule}), std::invalid_argument);
}

TEST_F(RuleSetValidationTest, RejectsEmptyReplacement) {
  EXPECT_THROW(RuleSet rules({ReplaceRule(RuleCategory::kCustom, 0x2100, "")}),
               std::invalid_argument);
}

TEST_F(RuleSetValidationTest, RejectsInvalidUtf8Replacement) {
  EXPECT_THROW(RuleSet rules({ReplaceRule(RuleCategory::kCustom, 0x2100, "\xFF")}),
               std::invalid_argument);
}

TEST_F(RuleSetValidationTest, RejectsMarkersInsideLongerReplacement) {
  EXPECT_THROW(RuleSet rules({ReplaceRule(RuleCategory::kCustom, 0x2100, "**")}),
               std::invalid_argument);
  EXPECT_THROW(RuleSet rules({ReplaceRule(RuleCategory::kCustom, 0x2100, "a#")}),
               std::invalid_argument);
  EXPECT_THROW(RuleSet rules({ReplaceRule(RuleCategory::kCustom, 0x2100, "\n")}),
               std::invalid_argument);
  EXPECT_NO_THROW(RuleSet rules({ReplaceRule(RuleCategory::kCustom, 0x2100, "*")}));
}

TEST_F(RuleSetValidationTest, RejectsSelfFeedingReplacement) {
  // U+2100 -> U+00A0, which the whitespace rule would rewrite again
  EXPECT_THROW(RuleSet rules(WithDefaults(ReplaceRule(RuleCategory::kCustom, 0x2100, "\xC2\xA0"))),
               std::invalid_argument);
}

TEST_F(RuleSetValidationTest, RejectsRemovalOfAnotherRulesOutput) {
  // Dashes become '-', so '-' cannot also be removed
  EXPECT_THROW(RuleSet rules(WithDefaults(RemoveRule(RuleCategory::kCustom, '-', '-'))),
               std::invalid_argument);
  // Fullwidth shifts onto ASCII letters
  EXPECT_THROW(RuleSet rules(WithDefaults(RemoveRule(RuleCategory::kCustom, 'a', 'a'))),
               std::invalid_argument);
}

TEST_F(RuleSetValidationTest, RejectsShiftOutOfRange) {
  SubstitutionRule rule = RemoveRule(RuleCategory::kCustom, 0x10, 0x20);
  rule.action = RuleAction::kShift;
  rule.shift = -0x11;
  EXPECT_THROW(RuleSet rules({rule}), std::invalid_argument);
}

TEST_F(RuleSetValidationTest, RejectsShiftOntoLineBreak) {
  SubstitutionRule rule = RemoveRule(RuleCategory::kCustom, 0x2100, 0x2101);
  rule.action = RuleAction::kShift;
  rule.shift = '\n' - 0x2100;
  EXPECT_THROW(RuleSet rules({rule}), std::invalid_argument);
}

TEST_F(RuleSetValidationTest, RejectsMisboundMarkdownPattern) {
  SubstitutionRule rule;
  rule.category = RuleCategory::kMarkdown;
  rule.matcher = MatcherKind::kEmphasis;
  rule.first = rule.last = '_';
  EXPECT_THROW(RuleSet rules({rule}), std::invalid_argument);
}

TEST_F(RuleSetValidationTest, AcceptsCustomWatermarkRemoval) {
  RuleSet rules(WithDefaults(RemoveRule(RuleCategory::kCustom, 0x2728, 0x2728)));
  ASSERT_NE(rules.Find(0x2728), nullptr);
  EXPECT_EQ(rules.Find(0x2728)->category, RuleCategory::kCustom);
}

TEST_F(RuleSetValidationTest, CopiesStayUsable) {
  RuleSet original;
  RuleSet copy = original;
  const SubstitutionRule* rule = copy.Find(0x2014);
  ASSERT_NE(rule, nullptr);
  EXPECT_GE(rule, copy.rules().data());
  EXPECT_LT(rule, copy.rules().data() + copy.size());
  EXPECT_EQ(copy.size(), original.size());
}

// =============================================================================
// ParseCodepointRange / MakeRuleSet Tests
// =============================================================================

class CodepointParseTest : public ::testing::Test {};

TEST_F(CodepointParseTest, SingleScalar) {
  char32_t first = 0;
  char32_t last = 0;
  ASSERT_TRUE(ParseCodepointRange("U+2728", &first, &last));
  EXPECT_EQ(first, 0x2728u);
  EXPECT_EQ(last, 0x2728u);

  ASSERT_TRUE(ParseCodepointRange("  1f916 ", &first, &last));
  EXPECT_EQ(first, 0x1F916u);
  EXPECT_EQ(last, 0x1F916u);
}

TEST_F(CodepointParseTest, Range) {
  char32_t first = 0;
  char32_t last = 0;
  ASSERT_TRUE(ParseCodepointRange("U+2700-U+27BF", &first, &last));
  EXPECT_EQ(first, 0x2700u);
  EXPECT_EQ(last, 0x27BFu);

  ASSERT_TRUE(ParseCodepointRange("0x2700 - 0x27bf", &first, &last));
  EXPECT_EQ(first, 0x2700u);
  EXPECT_EQ(last, 0x27BFu);
}

TEST_F(CodepointParseTest, RejectsGarbage) {
  char32_t first = 0;
  char32_t last = 0;
  EXPECT_FALSE(ParseCodepointRange("", &first, &last));
  EXPECT_FALSE(ParseCodepointRange("U+", &first, &last));
  EXPECT_FALSE(ParseCodepointRange("U+XYZ", &first, &last));
  EXPECT_FALSE(ParseCodepointRange("U+110000", &first, &last));
  EXPECT_FALSE(ParseCodepointRange("U+D800", &first, &last));
  EXPECT_FALSE(ParseCodepointRange("U+27BF-U+2700", &first, &last));
  EXPECT_FALSE(ParseCodepointRange("U+1234567", &first, &last));
}

TEST_F(CodepointParseTest, MakeRuleSetAppendsCustomRemovals) {
  RuleOptions options;
  options.remove_codepoints = {"U+2728", "U+1F916-U+1F917"};
  RuleSet rules = MakeRuleSet(options);
  EXPECT_EQ(rules.size(), DefaultRules().size() + 2);
  EXPECT_EQ(rules.rules().back().category, RuleCategory::kCustom);
  EXPECT_EQ(rules.rules().back().matcher, MatcherKind::kRange);
  EXPECT_NE(rules.Find(0x1F917), nullptr);
}

TEST_F(CodepointParseTest, MakeRuleSetRejectsBadEntries) {
  RuleOptions options;
  options.remove_codepoints = {"sparkles"};
  EXPECT_THROW(MakeRuleSet(options), std::invalid_argument);

  options.remove_codepoints = {"U+0022"};  // '"' is a quote rule's output
  EXPECT_THROW(MakeRuleSet(options), std::invalid_argument);
}

}  // namespace
}  // namespace textscrub
