#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight ids and positions (LineId/SegmentId/ElementId/Cursor).
 * Principle: carry simple state; ids are opaque handles, only compared for equality.
 */
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>

struct LineId {
  std::uint64_t value = 0;
  bool operator==(const LineId&) const = default;
};

struct SegmentId {
  std::uint64_t value = 0;
  bool operator==(const SegmentId&) const = default;
};

// Position of an element in the form: declaration order inside its step.
struct ElementId {
  std::size_t step_index = 0;
  std::size_t element_index = 0;
  auto operator<=>(const ElementId&) const = default;
};

struct Cursor { int row = 0; int col = 0; };
struct Viewport { int top_line = 0; int left_col = 0; };

// Cursor anchored to a segment: offset counts characters into the segment's text.
struct RelativePosition {
  LineId line;
  SegmentId segment;
  int offset = 0;
};

struct Style {
  int color_pair = 0; // 0: terminal default
  bool reverse = false;
  bool operator==(const Style&) const = default;
};

// Monotonic id source; owners inject one per id space instead of a global counter.
class IdSequence {
public:
  explicit IdSequence(std::uint64_t first = 1) : next_(first) {}
  std::uint64_t next() { return next_++; }
private:
  std::uint64_t next_;
};

template <>
struct std::hash<LineId> {
  std::size_t operator()(const LineId& id) const noexcept { return std::hash<std::uint64_t>{}(id.value); }
};

template <>
struct std::hash<SegmentId> {
  std::size_t operator()(const SegmentId& id) const noexcept { return std::hash<std::uint64_t>{}(id.value); }
};
