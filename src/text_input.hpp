#pragma once
/*
 * TextInput
 *
 * Purpose: editable text field. Single-line fields render one inline segment; multi-line fields
 *          render one block line per text line and capture Enter for new lines.
 * Layout: the painted widths of its segments are fed back into the TextBuffer for wrap-aware Up/Down.
 */
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "dependency.hpp"
#include "element.hpp"
#include "text_buffer.hpp"

class TextInput : public Element {
public:
  explicit TextInput(bool multi_line = false);

  TextBuffer& text() { return text_; }
  const TextBuffer& text() const { return text_; }
  // Publish evaluation(value()) under id after every edit.
  void set_evaluation(DependencyId id, Evaluation evaluation);

  bool render(Coordinator& coordinator, std::string& msg) override;
  void update_layout(const LayoutAccessor& accessor) override;
  bool is_input() const override { return true; }
  bool captures_enter() const override { return text_.multi_line(); }
  bool update(const Key& key) override;
  std::string value() const override { return text_.value(); }
  bool evaluate(DependencyState& state) const override;

private:
  bool render_single(Coordinator& coordinator, std::string& msg);
  bool render_multi(Coordinator& coordinator, std::string& msg);

  TextBuffer text_;
  std::optional<std::pair<DependencyId, Evaluation>> evaluation_;
  std::optional<SegmentId> segment_id_;
  std::vector<LineId> line_ids_;
  std::vector<SegmentId> segment_ids_;
};
