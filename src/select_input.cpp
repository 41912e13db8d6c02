#include "select_input.hpp"
#include <stdexcept>
#include "config.hpp"
#include "coordinator.hpp"

SelectInput::SelectInput(std::string prompt, std::vector<SelectOption> options)
    : prompt_(std::move(prompt)), options_(std::move(options)) {
  if (options_.empty()) throw std::invalid_argument("select input: \"" + prompt_ + "\" has no options");
}

void SelectInput::select(std::size_t index) {
  if (index >= options_.size())
    throw std::out_of_range("select input: option " + std::to_string(index) + " out of range");
  selected_ = index;
}

void SelectInput::set_evaluation(DependencyId id, Evaluation evaluation) {
  evaluation_ = std::make_pair(id, std::move(evaluation));
}

static std::string option_row(const SelectOption& option, bool selected) {
  return (selected ? " > " : "   ") + option.value + " - " + option.description;
}

bool SelectInput::render(Coordinator& coordinator, std::string& msg) {
  if (!segment_id_) segment_id_ = coordinator.add_segment(id()).identifier();

  LineId line_id = coordinator.get_inline_line_id(id());
  if (!coordinator.interface().get_line(line_id).get_segment_index(*segment_id_)) {
    msg = "select input: segment " + std::to_string(segment_id_->value) + " is no longer on its inline line";
    return false;
  }
  coordinator.get_segment(id(), *segment_id_).set_text(value());

  if (focused()) {
    show_drawer(coordinator);
    coordinator.set_cursor(RelativePosition{line_id, *segment_id_, 0});
  } else {
    hide_drawer(coordinator);
  }
  return true;
}

// drawer_[0] holds the prompt, drawer_[i + 1] option i
void SelectInput::show_drawer(Coordinator& coordinator) {
  if (drawer_.empty()) {
    Line& line = coordinator.add_line(id());
    Segment& prompt = line.add_segment();
    prompt.set_text(prompt_);
    prompt.set_style(Style{TF_COLOR_ACCENT, false});
    drawer_.push_back(line.identifier());
    drawer_segments_.push_back(prompt.identifier());
    for (std::size_t i = 0; i < options_.size(); ++i) {
      Line& row = coordinator.add_line(id());
      drawer_.push_back(row.identifier());
      drawer_segments_.push_back(row.add_segment().identifier());
    }
  }
  for (std::size_t i = 0; i < options_.size(); ++i) {
    Segment& segment = coordinator.get_line(id(), drawer_[i + 1]).get_segment(drawer_segments_[i + 1]);
    bool selected = i == selected_;
    segment.set_text(option_row(options_[i], selected));
    segment.set_style(Style{selected ? TF_COLOR_SELECTED : TF_COLOR_MUTED, false});
  }
}

void SelectInput::hide_drawer(Coordinator& coordinator) {
  while (!drawer_.empty()) {
    coordinator.remove_line(id(), drawer_.back());
    drawer_.pop_back();
    drawer_segments_.pop_back();
  }
}

bool SelectInput::update(const Key& key) {
  if (key.code == KeyCode::Up) selected_ = selected_ == 0 ? options_.size() - 1 : selected_ - 1;
  else if (key.code == KeyCode::Down) selected_ = selected_ + 1 == options_.size() ? 0 : selected_ + 1;
  return false;
}

bool SelectInput::evaluate(DependencyState& state) const {
  if (!evaluation_) return false;
  state.register_source(evaluation_->first, id());
  return state.update_evaluation(evaluation_->first, evaluation_->second.evaluate(value()));
}
