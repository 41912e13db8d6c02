#include "yes_no_input.hpp"
#include "config.hpp"
#include "coordinator.hpp"

YesNoInput::YesNoInput(std::string prefix, bool omit_if_no)
    : prefix_(std::move(prefix)), omit_if_no_(omit_if_no) {}

void YesNoInput::set_evaluation(DependencyId id, Evaluation evaluation) {
  evaluation_ = std::make_pair(id, std::move(evaluation));
}

bool YesNoInput::render(Coordinator& coordinator, std::string& msg) {
  if (!segment_id_) segment_id_ = coordinator.add_segment(id()).identifier();

  LineId line_id = coordinator.get_inline_line_id(id());
  if (!coordinator.interface().get_line(line_id).get_segment_index(*segment_id_)) {
    msg = "yes/no input: segment " + std::to_string(segment_id_->value) + " is no longer on its inline line";
    return false;
  }

  Segment& segment = coordinator.get_segment(id(), *segment_id_);
  if (omitted() && !focused()) {
    segment.set_text(std::string());
    segment.clear_style();
    return true;
  }
  segment.set_text(prefix_ + ": " + answer_text());
  if (omitted()) segment.set_style(Style{TF_COLOR_MUTED, false});
  else segment.clear_style();

  if (focused()) coordinator.set_cursor(RelativePosition{line_id, *segment_id_, 0});
  return true;
}

bool YesNoInput::update(const Key& key) {
  switch (key.code) {
    case KeyCode::Up:
    case KeyCode::Down:
      answer_ = !answer_;
      break;
    case KeyCode::Char:
      if (key.ch == U'y' || key.ch == U'Y') answer_ = true;
      else if (key.ch == U'n' || key.ch == U'N') answer_ = false;
      break;
    default:
      break;
  }
  return false;
}

std::string YesNoInput::value() const {
  if (omitted()) return std::string();
  return prefix_ + ": " + answer_text();
}

bool YesNoInput::evaluate(DependencyState& state) const {
  if (!evaluation_) return false;
  state.register_source(evaluation_->first, id());
  return state.update_evaluation(evaluation_->first, evaluation_->second.evaluate(answer_text()));
}
