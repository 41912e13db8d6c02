#include "dynamic_element.hpp"
#include <algorithm>
#include "coordinator.hpp"

DynamicElement::DynamicElement(std::string label) : label_(std::move(label)) {}

void DynamicElement::set_state(int state) { state_ = std::clamp(state, 0, kMaxState); }

bool DynamicElement::render(Coordinator& coordinator, std::string&) {
  if (!base_) {
    Segment& segment = coordinator.add_segment(id());
    segment.set_text(label_ + "S0");
    base_ = segment.identifier();
  }

  switch (state_) {
    case 0:
      if (leading_) {
        coordinator.remove_segment(id(), *leading_);
        leading_.reset();
      }
      if (block_) {
        coordinator.remove_line(id(), *block_);
        block_.reset();
      }
      coordinator.try_inline_join(id());
      break;
    case 1:
      if (block_) {
        coordinator.remove_line(id(), *block_);
        block_.reset();
      } else if (!leading_) {
        Segment& segment = coordinator.insert_segment(id(), 0);
        segment.set_text(label_ + "S1");
        leading_ = segment.identifier();
        coordinator.try_inline_split(id());
      }
      break;
    default:
      if (leading_) {
        coordinator.remove_segment(id(), *leading_);
        leading_.reset();
      }
      if (!block_) {
        Line& line = coordinator.add_line(id());
        line.add_segment().set_text(label_ + "S2");
        block_ = line.identifier();
      }
      break;
  }

  if (focused()) coordinator.set_cursor(RelativePosition{coordinator.get_inline_line_id(id()), *base_, 0});
  return true;
}

bool DynamicElement::update(const Key& key) {
  if (key.code == KeyCode::Right) set_state(state_ + 1);
  else if (key.code == KeyCode::Left) set_state(state_ - 1);
  return false;
}
