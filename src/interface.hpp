#pragma once
/*
 * Interface
 *
 * Purpose: the terminal buffer: ordered display lines of segments, a staged cursor, and the
 *          commit step that lays the lines out and paints them through ITerminal.
 * Ownership: owns its lines and both id sequences; the terminal is borrowed.
 * Errors: unknown ids/indices throw std::out_of_range; apply_changes reports runtime failures via msg.
 */
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "layout.hpp"
#include "line.hpp"
#include "renderer.hpp"
#include "types.hpp"

class Interface {
public:
  explicit Interface(ITerminal& term);
  Interface(const Interface&) = delete;
  Interface& operator=(const Interface&) = delete;

  Line& add_line();
  Line& insert_line(std::size_t index);
  void remove_line(LineId id);
  void remove_line_at(std::size_t index);
  std::optional<std::size_t> get_line_index(LineId id) const;
  const Line& get_line(LineId id) const;
  Line& get_line(LineId id);
  const Line& line_at(std::size_t index) const;
  std::vector<const Line*> get_lines(const std::vector<LineId>& ids) const;
  std::vector<LineId> line_ids() const;
  std::size_t line_count() const { return lines_.size(); }

  // Appends the segment to the end of `to`.
  void move_segment(SegmentId segment, LineId from, LineId to);

  void set_cursor(const RelativePosition& pos) { cursor_ = pos; }
  void hide_cursor() { cursor_.reset(); }
  const std::optional<RelativePosition>& cursor() const { return cursor_; }

  void set_max_width(int cols) { max_width_ = cols; }
  int max_width() const { return max_width_; }

  bool apply_changes(InterfaceLayout& layout, std::string& msg);
  // Parks the terminal cursor on the row after the form.
  void advance_to_end();

private:
  std::size_t require_index(LineId id) const;
  std::vector<const Line*> ordered_lines() const;

  ITerminal& term_;
  IdSequence line_seq_;
  IdSequence segment_seq_;
  std::vector<std::unique_ptr<Line>> lines_;
  std::optional<RelativePosition> cursor_;
  Renderer renderer_;
  int max_width_ = 0;
};
