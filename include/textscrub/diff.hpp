#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace textscrub {

enum class DiffKind : uint8_t { kEqual, kInsert, kDelete };

/** Wire name: "equal", "insert" or "delete". */
const char* DiffKindName(DiffKind kind);

/**
 * A maximal run of text that is kept, inserted or deleted.
 * `text` is never empty.
 */
struct DiffSegment {
  DiffKind kind = DiffKind::kEqual;
  std::string text;

  bool operator==(const DiffSegment& other) const {
    return kind == other.kind && text == other.text;
  }
  bool operator!=(const DiffSegment& other) const { return !(*this == other); }
};

enum class DiffGranularity : uint8_t {
  kCharacter,  // Unicode scalar values
  kLine        // Whole lines, each keeping its trailing '\n'
};

struct DiffOptions {
  // Upper bound on rows * cols of the alignment grid, counted after the
  // common prefix and suffix are trimmed. 0 = unlimited.
  uint64_t max_alignment_cells = 64ull * 1024ull * 1024ull;

  DiffGranularity granularity = DiffGranularity::kCharacter;
};

/**
 * Result of a diff. On success `segments` holds the alignment; the only
 * failure is an alignment larger than the configured budget, in which case
 * nothing was computed.
 */
struct DiffResult {
  bool success = false;
  bool resource_limit_exceeded = false;
  std::vector<DiffSegment> segments;
  std::string error_message;
  uint64_t alignment_cells = 0;  // rows * cols actually aligned (or refused)
};

/**
 * Align `original` against `canonical` and return the ordered segments.
 *
 * Uses a longest-common-subsequence alignment (Hirschberg, linear memory).
 * Guarantees:
 * - equal + delete segments concatenate to `original`
 * - equal + insert segments concatenate to `canonical`
 * - no two adjacent segments share a kind
 * - between two equal runs, deleted text precedes inserted text
 * - a pure deletion or insertion sits as far left as an equally long
 *   alignment allows, so equal text is not split around it
 *
 * Invalid UTF-8 bytes are aligned as single opaque units.
 */
DiffResult Diff(std::string_view original, std::string_view canonical,
                const DiffOptions& options = DiffOptions());

/** Concatenate the equal and delete segments. */
std::string ReconstructOriginal(const std::vector<DiffSegment>& segments);

/** Concatenate the equal and insert segments. */
std::string ReconstructCanonical(const std::vector<DiffSegment>& segments);

}  // namespace textscrub
