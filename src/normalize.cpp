#include <textscrub/normalize.hpp>
#include <textscrub/utf8.hpp>

#include <cstdint>
#include <set>
#include <vector>

namespace textscrub {

namespace {

// How a character's image looks to the markdown pass
enum class Shape : uint8_t {
  kRemoved,  // Image is empty
  kStar,     // Image is exactly "*"
  kHash,     // Image is exactly "#"
  kBreak,    // Image is a line break
  kText      // Anything else
};

// Class of the first or last byte of an image
enum class Edge : uint8_t { kSpace, kBreak, kOther };

struct Cell {
  const SubstitutionRule* rule = nullptr;  // nullptr = passes through
  Shape shape = Shape::kText;
  Edge lead = Edge::kOther;
  Edge trail = Edge::kOther;
  bool blank = false;  // Image is only spaces/tabs (heading padding)
  bool drop = false;   // Removed by the markdown pass
};

struct DelimiterRun {
  size_t begin = 0;  // Index into the live sequence
  size_t end = 0;
  bool can_open = false;
  bool can_close = false;
};

constexpr size_t kMaxDelimiterRun = 3;
constexpr size_t kMaxHeadingLevel = 6;

Edge EdgeOf(char c) {
  switch (c) {
    case ' ':
    case '\t':
    case '\v':
    case '\f':
      return Edge::kSpace;
    case '\n':
    case '\r':
      return Edge::kBreak;
    default:
      return Edge::kOther;
  }
}

// A lone 0x80-0xBF byte carried as an invalid unit
bool IsStrayContinuation(char32_t cp) {
  return cp >= internal::kInvalidByteBase + 0x80 && cp <= internal::kInvalidByteBase + 0xBF;
}

void Classify(std::string_view image, const RuleSet& rules, Cell* cell) {
  if (image.empty()) {
    cell->shape = Shape::kRemoved;
    return;
  }
  cell->lead = EdgeOf(image.front());
  cell->trail = EdgeOf(image.back());
  if (image == "*" && rules.StripsEmphasis()) {
    cell->shape = Shape::kStar;
  } else if (image == "#" && rules.StripsHeadings()) {
    cell->shape = Shape::kHash;
  } else if (image == "\n" || image == "\r") {
    cell->shape = Shape::kBreak;
  } else {
    cell->shape = Shape::kText;
    cell->blank = image.find_first_not_of(" \t") == std::string_view::npos;
  }
}

// Pair '*' runs line by line. An opener takes the first later run on the
// same line with the same length that can close.
void MarkEmphasis(const std::vector<size_t>& live, std::vector<Cell>* cells) {
  auto cell_at = [&](size_t i) -> Cell& { return (*cells)[live[i]]; };

  size_t i = 0;
  while (i < live.size()) {
    // Collect the runs of one line
    std::vector<DelimiterRun> runs;
    while (i < live.size() && cell_at(i).shape != Shape::kBreak) {
      if (cell_at(i).shape != Shape::kStar) {
        ++i;
        continue;
      }
      DelimiterRun run;
      run.begin = i;
      while (i < live.size() && cell_at(i).shape == Shape::kStar) ++i;
      run.end = i;
      if (run.end - run.begin <= kMaxDelimiterRun) {
        run.can_open = run.end < live.size() && cell_at(run.end).lead == Edge::kOther;
        run.can_close = run.begin > 0 && cell_at(run.begin - 1).trail == Edge::kOther;
        runs.push_back(run);
      }
    }
    ++i;  // Past the line break

    // Closer candidates per run length, by position
    std::set<size_t> closers[kMaxDelimiterRun + 1];
    for (size_t r = 0; r < runs.size(); ++r) {
      if (runs[r].can_close) closers[runs[r].end - runs[r].begin].insert(r);
    }
    std::vector<bool> used(runs.size(), false);

    for (size_t r = 0; r < runs.size(); ++r) {
      if (used[r] || !runs[r].can_open) continue;
      auto& candidates = closers[runs[r].end - runs[r].begin];
      candidates.erase(r);
      auto it = candidates.upper_bound(r);
      if (it == candidates.end()) continue;
      const size_t c = *it;
      candidates.erase(it);
      used[r] = used[c] = true;
      for (const size_t k : {r, c}) {
        for (size_t u = runs[k].begin; u < runs[k].end; ++u) {
          cell_at(u).drop = true;
        }
      }
    }
  }
}

// Strip "#"-run prefixes (and their padding) from the start of each line.
void MarkHeadings(const std::vector<size_t>& live, std::vector<Cell>* cells) {
  // Only characters that survive emphasis stripping take part
  std::vector<size_t> kept;
  kept.reserve(live.size());
  for (const size_t index : live) {
    if (!(*cells)[index].drop) kept.push_back(index);
  }
  auto cell_at = [&](size_t i) -> Cell& { return (*cells)[kept[i]]; };

  bool at_line_start = true;
  size_t i = 0;
  while (i < kept.size()) {
    if (!at_line_start) {
      at_line_start = cell_at(i).shape == Shape::kBreak;
      ++i;
      continue;
    }
    at_line_start = false;

    for (;;) {
      size_t j = i;
      while (j < kept.size() && cell_at(j).shape == Shape::kHash) ++j;
      const size_t level = j - i;
      if (level == 0 || level > kMaxHeadingLevel) break;
      if (j < kept.size() && cell_at(j).shape != Shape::kBreak && !cell_at(j).blank) break;

      while (j < kept.size() && cell_at(j).blank) ++j;
      for (size_t k = i; k < j; ++k) cell_at(k).drop = true;
      i = j;
    }
  }
}

}  // namespace

std::string Normalizer::Normalize(std::string_view input) const {
  if (input.empty()) {
    return std::string();
  }

  const std::vector<internal::CodeUnit> units = internal::Decode(input);
  std::vector<Cell> cells(units.size());
  std::vector<size_t> live;
  live.reserve(units.size());

  std::string image;
  for (size_t i = 0; i < units.size(); ++i) {
    const auto& unit = units[i];
    Cell& cell = cells[i];
    if (i + 1 < units.size() && IsStrayContinuation(units[i + 1].cp)) {
      // Pinned: dropping this unit could fuse the bytes around it into a
      // valid sequence, so it is kept verbatim and never acts as a marker
      Classify(input.substr(unit.offset, unit.length), rules_, &cell);
      if (cell.shape != Shape::kBreak) cell.shape = Shape::kText;
    } else if ((cell.rule = rules_.Find(unit.cp)) != nullptr) {
      image.clear();
      cell.rule->Apply(unit.cp, &image);
      Classify(image, rules_, &cell);
    } else {
      Classify(input.substr(unit.offset, unit.length), rules_, &cell);
    }
    if (cell.shape != Shape::kRemoved) {
      live.push_back(i);
    }
  }

  if (rules_.StripsEmphasis()) {
    MarkEmphasis(live, &cells);
  }
  if (rules_.StripsHeadings()) {
    MarkHeadings(live, &cells);
  }

  std::string result;
  result.reserve(input.size());
  for (size_t i = 0; i < units.size(); ++i) {
    const Cell& cell = cells[i];
    if (cell.drop) continue;
    if (cell.rule) {
      cell.rule->Apply(units[i].cp, &result);
    } else {
      result.append(input.substr(units[i].offset, units[i].length));
    }
  }
  return result;
}

std::string Normalize(std::string_view input) {
  static const Normalizer kDefault;
  return kDefault.Normalize(input);
}

}  // namespace textscrub
