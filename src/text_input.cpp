#include "text_input.hpp"
#include "coordinator.hpp"
#include "layout.hpp"

TextInput::TextInput(bool multi_line) : text_(multi_line) {}

void TextInput::set_evaluation(DependencyId id, Evaluation evaluation) {
  evaluation_ = std::make_pair(id, std::move(evaluation));
}

bool TextInput::render(Coordinator& coordinator, std::string& msg) {
  return text_.multi_line() ? render_multi(coordinator, msg) : render_single(coordinator, msg);
}

bool TextInput::render_single(Coordinator& coordinator, std::string& msg) {
  if (!segment_id_) segment_id_ = coordinator.add_segment(id()).identifier();

  LineId line_id = coordinator.get_inline_line_id(id());
  if (!coordinator.interface().get_line(line_id).get_segment_index(*segment_id_)) {
    msg = "text input: segment " + std::to_string(segment_id_->value) + " is no longer on its inline line";
    return false;
  }
  coordinator.get_segment(id(), *segment_id_).set_text(text_.line(0));

  if (focused()) coordinator.set_cursor(RelativePosition{line_id, *segment_id_, text_.cursor().col});
  return true;
}

bool TextInput::render_multi(Coordinator& coordinator, std::string& msg) {
  const auto& lines = text_.lines();
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i >= line_ids_.size()) {
      Line& line = coordinator.add_line(id());
      line_ids_.push_back(line.identifier());
      Segment& segment = line.add_segment();
      segment_ids_.push_back(segment.identifier());
      segment.set_text(lines[i]);
      continue;
    }
    Line& line = coordinator.get_line(id(), line_ids_[i]);
    if (!line.get_segment_index(segment_ids_[i])) {
      msg = "text input: segment " + std::to_string(segment_ids_[i].value) + " is no longer on its block line";
      return false;
    }
    line.get_segment(segment_ids_[i]).set_text(lines[i]);
  }

  while (line_ids_.size() > lines.size()) {
    coordinator.remove_line(id(), line_ids_.back());
    line_ids_.pop_back();
    segment_ids_.pop_back();
  }

  if (focused()) {
    Cursor cur = text_.cursor();
    auto row = static_cast<std::size_t>(cur.row);
    coordinator.set_cursor(RelativePosition{line_ids_[row], segment_ids_[row], cur.col});
  }
  return true;
}

static WrappedLine wrapped(const SegmentLayout& layout) {
  WrappedLine rows;
  for (const auto& part : layout.parts) rows.push_back(part.widths);
  return rows;
}

void TextInput::update_layout(const LayoutAccessor& accessor) {
  if (text_.empty()) return;

  std::vector<WrappedLine> layout;
  if (text_.multi_line()) {
    for (SegmentId seg : segment_ids_) {
      const SegmentLayout* sl = accessor.get_segment(seg);
      if (!sl) return;
      layout.push_back(wrapped(*sl));
    }
  } else {
    if (!segment_id_) return;
    const SegmentLayout* sl = accessor.get_segment(*segment_id_);
    if (!sl) return;
    layout.push_back(wrapped(*sl));
  }
  text_.set_layout(std::move(layout));
}

bool TextInput::update(const Key& key) {
  text_.update(key);
  return false;
}

bool TextInput::evaluate(DependencyState& state) const {
  if (!evaluation_) return false;
  state.register_source(evaluation_->first, id());
  return state.update_evaluation(evaluation_->first, evaluation_->second.evaluate(value()));
}
