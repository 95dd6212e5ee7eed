#include <textscrub/diff.hpp>
#include <textscrub/utf8.hpp>

#include <algorithm>
#include <limits>
#include <unordered_map>

namespace textscrub {

namespace {

enum class Op : uint8_t { kEqual, kInsert, kDelete };

struct Span {
  size_t offset = 0;
  size_t length = 0;
};

// A text cut into alignment tokens. Equal ids mean equal tokens.
struct Sequence {
  std::vector<uint32_t> ids;
  std::vector<Span> spans;
};

Sequence SplitCharacters(std::string_view text) {
  Sequence seq;
  const auto units = internal::Decode(text);
  seq.ids.reserve(units.size());
  seq.spans.reserve(units.size());
  for (const auto& unit : units) {
    seq.ids.push_back(static_cast<uint32_t>(unit.cp));
    seq.spans.push_back({unit.offset, unit.length});
  }
  return seq;
}

Sequence SplitLines(std::string_view text,
                    std::unordered_map<std::string_view, uint32_t>* interned) {
  Sequence seq;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    end = (end == std::string_view::npos) ? text.size() : end + 1;
    const std::string_view line = text.substr(start, end - start);
    auto it = interned->emplace(line, static_cast<uint32_t>(interned->size())).first;
    seq.ids.push_back(it->second);
    seq.spans.push_back({start, end - start});
    start = end;
  }
  return seq;
}

/**
 * Hirschberg's linear-space LCS alignment. Ops are appended in document
 * order; a token missing from one side is a delete (from a) or insert (into b).
 */
class Aligner {
 public:
  Aligner(const std::vector<uint32_t>& a, const std::vector<uint32_t>& b, std::vector<Op>* ops)
      : a_(a), b_(b), ops_(ops) {}

  void Align(size_t a_lo, size_t a_hi, size_t b_lo, size_t b_hi) {
    // Common prefix
    size_t prefix = 0;
    while (a_lo + prefix < a_hi && b_lo + prefix < b_hi && a_[a_lo + prefix] == b_[b_lo + prefix]) {
      ++prefix;
    }
    Emit(Op::kEqual, prefix);
    a_lo += prefix;
    b_lo += prefix;

    // Common suffix, emitted after the middle
    size_t suffix = 0;
    while (a_hi - suffix > a_lo && b_hi - suffix > b_lo &&
           a_[a_hi - suffix - 1] == b_[b_hi - suffix - 1]) {
      ++suffix;
    }
    a_hi -= suffix;
    b_hi -= suffix;

    const size_t n = a_hi - a_lo;
    const size_t m = b_hi - b_lo;
    if (n == 0) {
      Emit(Op::kInsert, m);
    } else if (m == 0) {
      Emit(Op::kDelete, n);
    } else if (n == 1) {
      AlignSingleA(a_lo, b_lo, b_hi);
    } else if (m == 1) {
      AlignSingleB(a_lo, a_hi, b_lo);
    } else {
      const size_t mid = a_lo + n / 2;
      ForwardRow(a_lo, mid, b_lo, b_hi);
      ReverseRow(mid, a_hi, b_lo, b_hi);

      // First split point with the longest combined subsequence
      size_t split = 0;
      uint32_t best = 0;
      for (size_t k = 0; k <= m; ++k) {
        const uint32_t total = forward_[k] + reverse_[k];
        if (total > best || k == 0) {
          best = total;
          split = k;
        }
      }
      Align(a_lo, mid, b_lo, b_lo + split);
      Align(mid, a_hi, b_lo + split, b_hi);
    }

    Emit(Op::kEqual, suffix);
  }

 private:
  void Emit(Op op, size_t count) {
    ops_->insert(ops_->end(), count, op);
  }

  // One token on the a side: keep it if b contains it, else replace.
  void AlignSingleA(size_t a_pos, size_t b_lo, size_t b_hi) {
    const auto begin = b_.begin() + static_cast<std::ptrdiff_t>(b_lo);
    const auto end = b_.begin() + static_cast<std::ptrdiff_t>(b_hi);
    const auto hit = std::find(begin, end, a_[a_pos]);
    if (hit == end) {
      Emit(Op::kDelete, 1);
      Emit(Op::kInsert, b_hi - b_lo);
      return;
    }
    const size_t before = static_cast<size_t>(hit - begin);
    Emit(Op::kInsert, before);
    Emit(Op::kEqual, 1);
    Emit(Op::kInsert, b_hi - b_lo - before - 1);
  }

  // One token on the b side: keep it if a contains it, else replace.
  void AlignSingleB(size_t a_lo, size_t a_hi, size_t b_pos) {
    const auto begin = a_.begin() + static_cast<std::ptrdiff_t>(a_lo);
    const auto end = a_.begin() + static_cast<std::ptrdiff_t>(a_hi);
    const auto hit = std::find(begin, end, b_[b_pos]);
    if (hit == end) {
      Emit(Op::kDelete, a_hi - a_lo);
      Emit(Op::kInsert, 1);
      return;
    }
    const size_t before = static_cast<size_t>(hit - begin);
    Emit(Op::kDelete, before);
    Emit(Op::kEqual, 1);
    Emit(Op::kDelete, a_hi - a_lo - before - 1);
  }

  // forward_[j] = LCS(a[a_lo, a_hi), b[b_lo, b_lo + j))
  void ForwardRow(size_t a_lo, size_t a_hi, size_t b_lo, size_t b_hi) {
    const size_t m = b_hi - b_lo;
    forward_.assign(m + 1, 0);
    for (size_t i = a_lo; i < a_hi; ++i) {
      uint32_t diag = 0;
      for (size_t j = 1; j <= m; ++j) {
        const uint32_t above = forward_[j];
        forward_[j] = (a_[i] == b_[b_lo + j - 1]) ? diag + 1
                                                  : std::max(above, forward_[j - 1]);
        diag = above;
      }
    }
  }

  // reverse_[j] = LCS(a[a_lo, a_hi), b[b_lo + j, b_hi))
  void ReverseRow(size_t a_lo, size_t a_hi, size_t b_lo, size_t b_hi) {
    const size_t m = b_hi - b_lo;
    reverse_.assign(m + 1, 0);
    for (size_t i = a_hi; i-- > a_lo;) {
      uint32_t diag = 0;
      for (size_t j = m; j-- > 0;) {
        const uint32_t below = reverse_[j];
        reverse_[j] = (a_[i] == b_[b_lo + j]) ? diag + 1 : std::max(below, reverse_[j + 1]);
        diag = below;
      }
    }
  }

  const std::vector<uint32_t>& a_;
  const std::vector<uint32_t>& b_;
  std::vector<Op>* ops_;
  std::vector<uint32_t> forward_;
  std::vector<uint32_t> reverse_;
};

// Slide every pure delete or pure insert block left across equal tokens
// that match its last token, so the equal text after it grows into one
// contiguous run: "#[ #]1" becomes "[# ]#1". A block that touches an
// opposite-kind block is a replacement and stays put.
void SlideBlocksLeft(const std::vector<uint32_t>& a, const std::vector<uint32_t>& b,
                     std::vector<Op>* ops) {
  std::vector<Op>& seq = *ops;
  const size_t n = seq.size();
  size_t ia = 0;
  size_t ib = 0;
  size_t p = 0;
  while (p < n) {
    if (seq[p] == Op::kEqual) {
      ++ia;
      ++ib;
      ++p;
      continue;
    }

    const Op kind = seq[p];
    size_t q = p;
    while (q < n && seq[q] == kind) ++q;
    const size_t len = q - p;
    const bool is_delete = kind == Op::kDelete;

    if (q == n || seq[q] == Op::kEqual) {
      const std::vector<uint32_t>& ids = is_delete ? a : b;
      size_t start = is_delete ? ia : ib;  // Token index of the block's first unit
      size_t s = p;
      while (s > 0 && seq[s - 1] == Op::kEqual && ids[start - 1] == ids[start + len - 1]) {
        seq[s - 1] = kind;
        seq[s + len - 1] = Op::kEqual;
        --s;
        --start;
      }
    }

    if (is_delete) {
      ia += len;
    } else {
      ib += len;
    }
    p = q;
  }
}

// Turn token ops into maximal segments. Between two equal runs every
// deleted token is contiguous in `original` and every inserted token is
// contiguous in `canonical`, so each becomes a single segment, delete first.
std::vector<DiffSegment> BuildSegments(const std::vector<Op>& ops, std::string_view original,
                                       const Sequence& a, std::string_view canonical,
                                       const Sequence& b) {
  std::vector<DiffSegment> segments;
  size_t ia = 0;
  size_t ib = 0;

  Span equal{0, 0};
  Span deleted{0, 0};
  Span inserted{0, 0};

  auto push = [&](DiffKind kind, std::string_view text, const Span& span) {
    if (span.length > 0) {
      segments.push_back({kind, std::string(text.substr(span.offset, span.length))});
    }
  };
  auto flush_changes = [&]() {
    push(DiffKind::kDelete, original, deleted);
    push(DiffKind::kInsert, canonical, inserted);
    deleted.length = 0;
    inserted.length = 0;
  };

  for (const Op op : ops) {
    switch (op) {
      case Op::kEqual: {
        if (deleted.length > 0 || inserted.length > 0) {
          push(DiffKind::kEqual, original, equal);
          equal.length = 0;
          flush_changes();
        }
        const Span& span = a.spans[ia];
        if (equal.length == 0) equal.offset = span.offset;
        equal.length += span.length;
        ++ia;
        ++ib;
        break;
      }
      case Op::kDelete: {
        const Span& span = a.spans[ia++];
        if (deleted.length == 0) deleted.offset = span.offset;
        deleted.length += span.length;
        break;
      }
      case Op::kInsert: {
        const Span& span = b.spans[ib++];
        if (inserted.length == 0) inserted.offset = span.offset;
        inserted.length += span.length;
        break;
      }
    }
  }
  push(DiffKind::kEqual, original, equal);
  flush_changes();
  return segments;
}

}  // namespace

const char* DiffKindName(DiffKind kind) {
  switch (kind) {
    case DiffKind::kEqual: return "equal";
    case DiffKind::kInsert: return "insert";
    case DiffKind::kDelete: return "delete";
  }
  return "unknown";
}

DiffResult Diff(std::string_view original, std::string_view canonical,
                const DiffOptions& options) {
  DiffResult result;

  // Identical inputs need no alignment
  if (original == canonical) {
    if (!original.empty()) {
      result.segments.push_back({DiffKind::kEqual, std::string(original)});
    }
    result.success = true;
    return result;
  }

  Sequence a;
  Sequence b;
  std::unordered_map<std::string_view, uint32_t> interned;
  if (options.granularity == DiffGranularity::kLine) {
    a = SplitLines(original, &interned);
    b = SplitLines(canonical, &interned);
  } else {
    a = SplitCharacters(original);
    b = SplitCharacters(canonical);
  }

  // Only the part between the common prefix and suffix needs a grid
  const size_t n = a.ids.size();
  const size_t m = b.ids.size();
  size_t prefix = 0;
  while (prefix < n && prefix < m && a.ids[prefix] == b.ids[prefix]) ++prefix;
  size_t suffix = 0;
  while (suffix < n - prefix && suffix < m - prefix &&
         a.ids[n - suffix - 1] == b.ids[m - suffix - 1]) {
    ++suffix;
  }
  const uint64_t rows = n - prefix - suffix;
  const uint64_t cols = m - prefix - suffix;
  const bool overflow = rows != 0 && cols > std::numeric_limits<uint64_t>::max() / rows;
  result.alignment_cells = overflow ? std::numeric_limits<uint64_t>::max() : rows * cols;

  if (options.max_alignment_cells != 0 && result.alignment_cells > options.max_alignment_cells) {
    result.resource_limit_exceeded = true;
    result.error_message = "alignment of " + std::to_string(rows) + " x " + std::to_string(cols) +
                           " units exceeds the budget of " +
                           std::to_string(options.max_alignment_cells) + " cells";
    return result;
  }

  std::vector<Op> ops;
  ops.reserve(n + m);
  Aligner aligner(a.ids, b.ids, &ops);
  aligner.Align(0, n, 0, m);
  SlideBlocksLeft(a.ids, b.ids, &ops);

  result.segments = BuildSegments(ops, original, a, canonical, b);
  result.success = true;
  return result;
}

std::string ReconstructOriginal(const std::vector<DiffSegment>& segments) {
  std::string out;
  for (const auto& segment : segments) {
    if (segment.kind != DiffKind::kInsert) out += segment.text;
  }
  return out;
}

std::string ReconstructCanonical(const std::vector<DiffSegment>& segments) {
  std::string out;
  for (const auto& segment : segments) {
    if (segment.kind != DiffKind::kDelete) out += segment.text;
  }
  return out;
}

}  // namespace textscrub
