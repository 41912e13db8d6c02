#pragma once
/*
 * Line / Segment
 *
 * Purpose: one display line of the terminal buffer as an ordered run of styled text segments.
 * Note: lines mint segment ids from the owning Interface's sequence; unknown ids/indices throw.
 */
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "types.hpp"

class Segment {
public:
  explicit Segment(SegmentId id) : id_(id) {}
  SegmentId identifier() const { return id_; }
  const std::string& text() const { return text_; }
  void set_text(std::string_view text) { text_ = std::string(text); }
  const std::optional<Style>& style() const { return style_; }
  void set_style(const Style& style) { style_ = style; }
  void clear_style() { style_.reset(); }
private:
  SegmentId id_;
  std::string text_;
  std::optional<Style> style_;
};

class Line {
public:
  Line(LineId id, IdSequence& segment_ids);
  LineId identifier() const { return id_; }

  std::size_t segment_count() const { return segments_.size(); }
  std::vector<SegmentId> segment_ids() const;
  const Segment& segment_at(std::size_t index) const;

  Segment& add_segment();
  Segment& insert_segment(std::size_t index);
  const Segment& get_segment(SegmentId id) const;
  Segment& get_segment(SegmentId id);
  std::vector<const Segment*> get_segments(const std::vector<SegmentId>& ids) const;
  std::optional<std::size_t> get_segment_index(SegmentId id) const;
  void remove_segment(SegmentId id);
  void remove_segment_at(std::size_t index);

  // Relocation between lines, used by Interface::move_segment.
  Segment take_segment(SegmentId id);
  void push_segment(Segment segment);

private:
  std::size_t require_index(SegmentId id) const;

  LineId id_;
  IdSequence* segment_ids_;
  std::vector<Segment> segments_;
};
