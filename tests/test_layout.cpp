#include "layout.hpp"
#include "line.hpp"
#include <cassert>
#include <vector>

static void test_segments_flow_and_wrap() {
  IdSequence seq;
  Line line(LineId{1}, seq);
  line.add_segment().set_text("hello");
  SegmentId world = line.add_segment().identifier();
  line.get_segment(world).set_text("world");

  InterfaceLayout layout = compute_layout({&line}, 8);
  assert(layout.lines.size() == 1);
  assert(layout.row_count() == 2);
  const LineLayout& ll = layout.lines[0];
  assert(ll.first_row == 0 && ll.row_count == 2);
  assert(ll.segments.size() == 2);

  const SegmentLayout& first = ll.segments[0];
  assert(first.parts.size() == 1);
  assert(first.parts[0].col == 0 && first.parts[0].width() == 5);

  const SegmentLayout& second = ll.segments[1];
  assert(second.segment_id == world);
  assert(second.char_count() == 5);
  assert(second.parts.size() == 2);
  assert(second.parts[0].row == 0 && second.parts[0].col == 5 && second.parts[0].width() == 3);
  assert(second.parts[1].row == 1 && second.parts[1].col == 0 && second.parts[1].first_char == 3);
  assert(second.parts[1].width() == 2);
}

static void test_lines_stack_and_empty_lines_take_a_row() {
  IdSequence seq;
  Line a(LineId{1}, seq);
  Line empty(LineId{2}, seq);
  Line b(LineId{3}, seq);
  a.add_segment().set_text("abcdefghij");
  b.add_segment().set_text("");

  InterfaceLayout layout = compute_layout({&a, &empty, &b}, 4);
  assert(layout.lines.size() == 3);
  assert(layout.lines[0].row_count == 3);
  assert(layout.lines[1].first_row == 3 && layout.lines[1].row_count == 1);
  assert(layout.lines[1].segments.empty());
  assert(layout.lines[2].first_row == 4);
  // an empty segment keeps one empty part so a cursor can sit in it
  assert(layout.lines[2].segments[0].parts.size() == 1);
  assert(layout.lines[2].segments[0].parts[0].widths.empty());
  assert(layout.row_count() == 5);
}

static void test_resolve_cursor() {
  IdSequence seq;
  Line line(LineId{7}, seq);
  line.add_segment().set_text("hello");
  SegmentId world = line.add_segment().identifier();
  line.get_segment(world).set_text("world");
  InterfaceLayout layout = compute_layout({&line}, 8);

  auto at = [&](int offset) { return resolve_cursor(layout, RelativePosition{LineId{7}, world, offset}, 8); };
  assert(at(0)->row == 0 && at(0)->col == 5);
  assert(at(2)->row == 0 && at(2)->col == 7);
  assert(at(3)->row == 1 && at(3)->col == 0);
  assert(at(5)->row == 1 && at(5)->col == 2);
  // offsets clamp to the segment
  assert(at(42)->col == 2);

  assert(!resolve_cursor(layout, RelativePosition{LineId{8}, world, 0}, 8));
  assert(!resolve_cursor(layout, RelativePosition{LineId{7}, SegmentId{99}, 0}, 8));
}

static void test_cursor_after_full_row_moves_down() {
  IdSequence seq;
  Line line(LineId{1}, seq);
  Segment& s = line.add_segment();
  s.set_text("abcd");
  InterfaceLayout layout = compute_layout({&line}, 4);
  assert(layout.row_count() == 1);
  auto c = resolve_cursor(layout, RelativePosition{LineId{1}, s.identifier(), 4}, 4);
  assert(c && c->row == 1 && c->col == 0);
}

static void test_layout_accessor() {
  IdSequence seq;
  Line line(LineId{1}, seq);
  SegmentId id = line.add_segment().identifier();
  line.get_segment(id).set_text("abc");
  LayoutAccessor accessor(compute_layout({&line}, 2));
  const SegmentLayout* sl = accessor.get_segment(id);
  assert(sl != nullptr);
  assert(sl->parts.size() == 2);
  assert(sl->parts[1].widths.size() == 1);
  assert(accessor.get_segment(SegmentId{1234}) == nullptr);
  assert(accessor.layout().row_count() == 2);
}

int main() {
  test_segments_flow_and_wrap();
  test_lines_stack_and_empty_lines_take_a_row();
  test_resolve_cursor();
  test_cursor_after_full_row_moves_down();
  test_layout_accessor();
  return 0;
}
