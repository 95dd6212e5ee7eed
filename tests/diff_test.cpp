// Unit tests for textscrub/diff.hpp
// Tests: Segment shape, line granularity, alignment budget, pipeline properties

#include <gtest/gtest.h>

#include <textscrub/diff.hpp>
#include <textscrub/normalize.hpp>
#include <textscrub/test_utils.hpp>
#include <textscrub/utf8.hpp>

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

namespace textscrub {
namespace {

using Segments = std::vector<DiffSegment>;

DiffSegment Eq(const std::string& text) { return {DiffKind::kEqual, text}; }
DiffSegment Ins(const std::string& text) { return {DiffKind::kInsert, text}; }
DiffSegment Del(const std::string& text) { return {DiffKind::kDelete, text}; }

// Shape every successful diff must have
void ExpectWellFormed(const std::string& original, const std::string& canonical,
                      const Segments& segments) {
  EXPECT_EQ(ReconstructOriginal(segments), original);
  EXPECT_EQ(ReconstructCanonical(segments), canonical);
  for (size_t i = 0; i < segments.size(); ++i) {
    EXPECT_FALSE(segments[i].text.empty()) << "segment " << i;
    if (i == 0) continue;
    EXPECT_NE(segments[i - 1].kind, segments[i].kind) << "segment " << i;
    EXPECT_FALSE(segments[i - 1].kind == DiffKind::kInsert &&
                 segments[i].kind == DiffKind::kDelete)
        << "insert before delete at segment " << i;
  }
}

// Textbook quadratic LCS over decoded units
size_t LcsLength(const std::string& a, const std::string& b) {
  const auto ua = internal::Decode(a);
  const auto ub = internal::Decode(b);
  std::vector<std::vector<size_t>> dp(ua.size() + 1, std::vector<size_t>(ub.size() + 1, 0));
  for (size_t i = 1; i <= ua.size(); ++i) {
    for (size_t j = 1; j <= ub.size(); ++j) {
      dp[i][j] = (ua[i - 1].cp == ub[j - 1].cp) ? dp[i - 1][j - 1] + 1
                                                : std::max(dp[i - 1][j], dp[i][j - 1]);
    }
  }
  return dp[ua.size()][ub.size()];
}

size_t EqualUnits(const Segments& segments) {
  size_t total = 0;
  for (const auto& segment : segments) {
    if (segment.kind == DiffKind::kEqual) total += internal::Decode(segment.text).size();
  }
  return total;
}

// =============================================================================
// Basic Diff Tests
// =============================================================================

class DiffTest : public ::testing::Test {
 protected:
  Segments Run(const std::string& original, const std::string& canonical) {
    DiffResult result = Diff(original, canonical);
    EXPECT_TRUE(result.success) << result.error_message;
    ExpectWellFormed(original, canonical, result.segments);
    return result.segments;
  }
};

TEST_F(DiffTest, BothEmpty) {
  EXPECT_TRUE(Run("", "").empty());
}

TEST_F(DiffTest, IdenticalText) {
  EXPECT_EQ(Run("same text", "same text"), Segments({Eq("same text")}));
}

TEST_F(DiffTest, OneSideEmpty) {
  EXPECT_EQ(Run("", "abc"), Segments({Ins("abc")}));
  EXPECT_EQ(Run("abc", ""), Segments({Del("abc")}));
}

TEST_F(DiffTest, NothingInCommon) {
  EXPECT_EQ(Run("abc", "xyz"), Segments({Del("abc"), Ins("xyz")}));
}

TEST_F(DiffTest, SingleReplacement) {
  EXPECT_EQ(Run("abXcd", "abYcd"), Segments({Eq("ab"), Del("X"), Ins("Y"), Eq("cd")}));
}

TEST_F(DiffTest, SmartQuotesAndDash) {
  EXPECT_EQ(Run("\xE2\x80\x9CHello\xE2\x80\x94world\xE2\x80\x9D", "\"Hello-world\""),
            Segments({Del("\xE2\x80\x9C"), Ins("\""), Eq("Hello"), Del("\xE2\x80\x94"), Ins("-"),
                      Eq("world"), Del("\xE2\x80\x9D"), Ins("\"")}));
}

TEST_F(DiffTest, MarkdownRemoval) {
  EXPECT_EQ(Run("**bold**", "bold"), Segments({Del("**"), Eq("bold"), Del("**")}));
}

TEST_F(DiffTest, MultiByteCharactersStayWhole) {
  EXPECT_EQ(Run("caf\xC3\xA9", "cafe"), Segments({Eq("caf"), Del("\xC3\xA9"), Ins("e")}));
}

TEST_F(DiffTest, InvalidBytesAreOpaqueUnits) {
  EXPECT_EQ(Run("a\xFF" "b", "ab"), Segments({Eq("a"), Del("\xFF"), Eq("b")}));
}

TEST_F(DiffTest, HeadingMarkerKeepsEqualRunWhole) {
  EXPECT_EQ(Run("# #1 priority", "#1 priority"), Segments({Del("# "), Eq("#1 priority")}));
}

TEST_F(DiffTest, EmphasisMarkerKeepsEqualRunWhole) {
  EXPECT_EQ(Run("* *a* b", "* a b"), Segments({Eq("* "), Del("*"), Eq("a"), Del("*"), Eq(" b")}));
  EXPECT_EQ(Run("**x", "*x"), Segments({Del("*"), Eq("*x")}));
}

TEST_F(DiffTest, InsertionKeepsEqualRunWhole) {
  EXPECT_EQ(Run("ab", "aab"), Segments({Ins("a"), Eq("ab")}));
}

TEST_F(DiffTest, ReplacementIsNotSlid) {
  EXPECT_EQ(Run("aXa", "aYa"), Segments({Eq("a"), Del("X"), Ins("Y"), Eq("a")}));
}

TEST_F(DiffTest, KindNames) {
  EXPECT_STREQ(DiffKindName(DiffKind::kEqual), "equal");
  EXPECT_STREQ(DiffKindName(DiffKind::kInsert), "insert");
  EXPECT_STREQ(DiffKindName(DiffKind::kDelete), "delete");
}

// =============================================================================
// Line Granularity Tests
// =============================================================================

class DiffLinesTest : public ::testing::Test {
 protected:
  static DiffOptions Lines() {
    DiffOptions options;
    options.granularity = DiffGranularity::kLine;
    return options;
  }
};

TEST_F(DiffLinesTest, ChangedLineIsReplacedWhole) {
  DiffResult result = Diff("a\nb\nc\n", "a\nB\nc\n", Lines());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.segments, Segments({Eq("a\n"), Del("b\n"), Ins("B\n"), Eq("c\n")}));
}

TEST_F(DiffLinesTest, LastLineWithoutNewline) {
  DiffResult result = Diff("x\ny", "x\nz", Lines());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.segments, Segments({Eq("x\n"), Del("y"), Ins("z")}));
}

TEST_F(DiffLinesTest, CellsCountLines) {
  DiffOptions options = Lines();
  options.max_alignment_cells = 4;
  DiffResult result = Diff("keep\n1\n2\nkeep\n", "keep\nA\nB\nkeep\n", options);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.alignment_cells, 4u);
  ExpectWellFormed("keep\n1\n2\nkeep\n", "keep\nA\nB\nkeep\n", result.segments);
}

// =============================================================================
// Alignment Budget Tests
// =============================================================================

class DiffBudgetTest : public ::testing::Test {
 protected:
  static DiffOptions Budget(uint64_t cells) {
    DiffOptions options;
    options.max_alignment_cells = cells;
    return options;
  }
};

TEST_F(DiffBudgetTest, OverBudgetIsRefused) {
  DiffResult result = Diff("aXXXb", "aYYYb", Budget(8));
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.resource_limit_exceeded);
  EXPECT_TRUE(result.segments.empty());
  EXPECT_EQ(result.alignment_cells, 9u);
  EXPECT_NE(result.error_message.find("budget"), std::string::npos);
}

TEST_F(DiffBudgetTest, ExactBudgetSucceeds) {
  DiffResult result = Diff("aXXXb", "aYYYb", Budget(9));
  ASSERT_TRUE(result.success);
  EXPECT_FALSE(result.resource_limit_exceeded);
  EXPECT_EQ(result.segments, Segments({Eq("a"), Del("XXX"), Ins("YYY"), Eq("b")}));
}

TEST_F(DiffBudgetTest, ZeroMeansUnlimited) {
  const std::string a(300, 'a');
  const std::string b(300, 'b');
  DiffResult result = Diff(a, b, Budget(0));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.alignment_cells, 90000u);
}

TEST_F(DiffBudgetTest, SharedPrefixAndSuffixAreFree) {
  const std::string filler(10000, 'x');
  DiffResult result = Diff(filler + "a" + filler, filler + "b" + filler, Budget(1));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.alignment_cells, 1u);
  EXPECT_EQ(result.segments, Segments({Eq(filler), Del("a"), Ins("b"), Eq(filler)}));
}

TEST_F(DiffBudgetTest, IdenticalInputsNeverRefused) {
  const std::string text(5000, 'q');
  DiffResult result = Diff(text, text, Budget(1));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.alignment_cells, 0u);
}

TEST_F(DiffBudgetTest, PureInsertionCostsNothing) {
  DiffResult result = Diff("ab", "aXYZb", Budget(1));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.segments, Segments({Eq("a"), Ins("XYZ"), Eq("b")}));
}

// =============================================================================
// Property Tests
// =============================================================================

class DiffPropertyTest : public ::testing::Test {};

TEST_F(DiffPropertyTest, NormalizedPairsAreWellFormed) {
  testing::RandomTextGenerator gen(42);
  for (const auto& text : gen.Batch(1000, 30)) {
    const std::string canonical = Normalize(text);
    DiffResult result = Diff(text, canonical);
    ASSERT_TRUE(result.success) << result.error_message;
    ExpectWellFormed(text, canonical, result.segments);
    if (text == canonical) {
      EXPECT_LE(result.segments.size(), 1u);
    }
  }
}

TEST_F(DiffPropertyTest, UnrelatedPairsAreWellFormed) {
  testing::RandomTextGenerator gen(17);
  const auto texts = gen.Batch(400, 12);
  for (size_t i = 0; i + 1 < texts.size(); i += 2) {
    DiffResult result = Diff(texts[i], texts[i + 1]);
    ASSERT_TRUE(result.success);
    ExpectWellFormed(texts[i], texts[i + 1], result.segments);
  }
}

TEST_F(DiffPropertyTest, EqualTextIsALongestCommonSubsequence) {
  testing::RandomTextGenerator gen(3);
  const auto texts = gen.Batch(200, 10);
  for (size_t i = 0; i + 1 < texts.size(); i += 2) {
    DiffResult result = Diff(texts[i], texts[i + 1]);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(EqualUnits(result.segments), LcsLength(texts[i], texts[i + 1]))
        << "a: " << texts[i] << " b: " << texts[i + 1];
  }
}

TEST_F(DiffPropertyTest, DeterministicAcrossThreads) {
  testing::RandomTextGenerator gen(8);
  const auto texts = gen.Batch(100, 30);
  std::vector<Segments> expected;
  for (const auto& text : texts) expected.push_back(Diff(text, Normalize(text)).segments);

  testing::TestResultCollector collector;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&]() {
      for (size_t i = 0; i < texts.size(); ++i) {
        CHECK_AND_RECORD(collector, Diff(texts[i], Normalize(texts[i])).segments == expected[i],
                         "diff mismatch at " + std::to_string(i));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_TRUE(collector.AllSucceeded());
}

}  // namespace
}  // namespace textscrub
