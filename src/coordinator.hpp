#pragma once
/*
 * Coordinator
 *
 * Purpose: allocate terminal-buffer lines and segments to form elements.
 * Model: every element owns a run of segments on one inline line (shared with its step siblings)
 *        plus zero or more block lines directly below it. Elements address their content relative
 *        to their own run; the Coordinator resolves absolute buffer indices.
 * Split/join: the first block line of an element moves the siblings after it onto a fresh line;
 *             releasing the last block line merges the following inline line back.
 * Constraint: operations resolve indices from preceding elements, so a render pass must visit
 *             elements in ascending ElementId order. Unknown ids throw std::out_of_range.
 */
#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>
#include "interface.hpp"
#include "layout.hpp"
#include "line.hpp"
#include "types.hpp"

class Step;

class Coordinator {
public:
  explicit Coordinator(Interface& interface);

  // One inline line per step, shared by the step's elements in declaration order. Call once.
  void initialize_elements(std::vector<Step>& steps);

  void set_cursor(const RelativePosition& cursor);
  void hide_cursor();
  bool apply_changes(InterfaceLayout& layout, std::string& msg);

  // Inline segments
  std::vector<const Segment*> segments(const ElementId& element) const;
  const Segment& get_segment(const ElementId& element, SegmentId segment) const;
  Segment& get_segment(const ElementId& element, SegmentId segment);
  // Dirty after any block line update of this or a preceding element.
  LineId get_inline_line_id(const ElementId& element) const;
  Segment& add_segment(const ElementId& element);
  Segment& insert_segment(const ElementId& element, std::size_t index);
  void remove_segment(const ElementId& element, SegmentId segment);
  void remove_segment_at(const ElementId& element, std::size_t index);

  // Block lines
  std::vector<const Line*> lines(const ElementId& element) const;
  const Line& get_line(const ElementId& element, LineId line) const;
  Line& get_line(const ElementId& element, LineId line);
  Line& add_line(const ElementId& element);
  Line& insert_line(const ElementId& element, std::size_t index);
  void remove_line(const ElementId& element, LineId line);
  void remove_line_at(const ElementId& element, std::size_t index);

  void try_inline_split(const ElementId& element);
  // No-op while the element still owns block lines.
  void try_inline_join(const ElementId& element);

  // Absolute index of the element's first segment on its inline line.
  std::size_t get_element_segment_index(const ElementId& element) const;
  // Absolute index of the line right below the element's inline line and the block lines of
  // every preceding element, i.e. where the element's first block line lives.
  std::size_t get_element_line_index(const ElementId& element) const;

  const std::vector<SegmentId>& segment_ids(const ElementId& element) const;
  const std::vector<LineId>& block_line_ids(const ElementId& element) const;
  const std::vector<ElementId>& inline_line_elements(LineId line) const;
  std::size_t inline_line_count() const { return inline_lines_.size(); }

  // Cross-checks the bookkeeping against the buffer.
  bool verify(std::string& msg) const;

  const Interface& interface() const { return interface_; }

private:
  struct ElementData {
    LineId inline_line_id;
    std::vector<SegmentId> segment_ids;
    std::vector<LineId> block_line_ids;
  };

  ElementData& data(const ElementId& element);
  const ElementData& data(const ElementId& element) const;
  std::size_t line_index(LineId line) const;
  LineId split_line(LineId line, std::size_t split_index);
  void join_inline_lines(LineId first, LineId second);
  // Merges the inline line found block_lines rows below the element's inline line.
  void join_following(const ElementId& element, std::size_t block_lines);

  std::map<ElementId, ElementData> elements_;
  std::unordered_map<LineId, std::vector<ElementId>> inline_lines_;
  Interface& interface_;
};
