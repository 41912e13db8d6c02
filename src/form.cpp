#include "form.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "coordinator.hpp"
#include "interface.hpp"
#include "layout.hpp"

const Element& Form::get_element(std::size_t step_index, std::size_t element_index) const {
  return get_step(step_index).get_element(element_index);
}

Element& Form::active_element() { return steps_[active_step_].get_element(active_element_); }
const Element& Form::active_element() const { return steps_[active_step_].get_element(active_element_); }

void Form::set_focus(bool focused) {
  if (active_step_ < steps_.size() && active_element_ < steps_[active_step_].size()) active_element().set_focused(focused);
}

bool Form::move_focus_forward() {
  std::size_t step = active_step_;
  std::size_t element = active_element_;
  while (true) {
    if (element + 1 >= steps_[step].size()) {
      if (step + 1 >= steps_.size()) return true;
      step++;
      element = 0;
    } else {
      element++;
    }
    if (element < steps_[step].size() && steps_[step].get_element(element).is_input()) break;
  }
  active_step_ = step;
  active_element_ = element;
  spdlog::debug("form: focus -> ({},{})", active_step_, active_element_);
  return false;
}

bool Form::move_focus_backward() {
  std::size_t step = active_step_;
  std::size_t element = active_element_;
  while (true) {
    if (element == 0) {
      if (step == 0) return true;
      step--;
      if (steps_[step].empty()) continue;
      element = steps_[step].size() - 1;
    } else {
      element--;
    }
    if (steps_[step].get_element(element).is_input()) break;
  }
  active_step_ = step;
  active_element_ = element;
  spdlog::debug("form: focus <- ({},{})", active_step_, active_element_);
  return false;
}

bool Form::evaluate_dependencies() {
  bool changed = false;
  for (auto& step : steps_) {
    for (auto& element : step.elements()) {
      if (element->evaluate(state_)) changed = true;
    }
  }
  return changed;
}

bool Form::render(Coordinator& coordinator, bool full, std::string& msg) {
  std::vector<Element*> rendered;
  if (full || active_step_ > max_step_) {
    std::size_t first = full ? 0 : max_step_ + 1;
    std::size_t last = full ? std::max(max_step_, active_step_) : active_step_;
    if (!full) spdlog::debug("form: revealing steps {}..{}", first, last);
    for (std::size_t s = first; s <= last && s < steps_.size(); ++s) {
      for (auto& element : steps_[s].elements()) rendered.push_back(element.get());
    }
  } else {
    rendered.push_back(&active_element());
  }
  max_step_ = std::max(max_step_, active_step_);

  // the element that lost focus drops what it only shows while focused
  if (!full && painted_focus_ != active()) {
    Element* blurred = &steps_[painted_focus_.step_index].get_element(painted_focus_.element_index);
    if (std::find(rendered.begin(), rendered.end(), blurred) == rendered.end()) rendered.push_back(blurred);
    std::sort(rendered.begin(), rendered.end(), [](const Element* a, const Element* b) { return a->id() < b->id(); });
  }
  painted_focus_ = active();

  coordinator.hide_cursor();
  for (Element* element : rendered) {
    if (!element->render(coordinator, msg)) return false;
  }

  InterfaceLayout layout;
  if (!coordinator.apply_changes(layout, msg)) return false;
  LayoutAccessor accessor(std::move(layout));
  for (Element* element : rendered) element->update_layout(accessor);
  return true;
}

void Form::handle_key(const Key& key) {
  auto advance = [this]() {
    set_focus(false);
    if (move_focus_forward()) {
      outcome_ = FormOutcome::Completed;
      return;
    }
    set_focus(true);
  };

  switch (key.code) {
    case KeyCode::CtrlC:
      outcome_ = FormOutcome::Cancelled;
      break;
    case KeyCode::Enter:
      if (!active_element().captures_enter() || active_element().update(key)) advance();
      break;
    case KeyCode::Tab:
      advance();
      break;
    case KeyCode::Esc:
    case KeyCode::BackTab:
      set_focus(false);
      if (move_focus_backward()) {
        outcome_ = FormOutcome::Cancelled;
        break;
      }
      set_focus(true);
      break;
    default:
      if (active_element().update(key)) advance();
      break;
  }
}

bool Form::execute(Interface& interface, IInputDevice& input, std::string& msg) {
  outcome_ = FormOutcome::Pending;
  active_step_ = 0;
  active_element_ = 0;
  max_step_ = 0;
  painted_focus_ = ElementId{};
  if (steps_.empty()) {
    outcome_ = FormOutcome::Completed;
    return true;
  }

  Coordinator coordinator(interface);
  coordinator.initialize_elements(steps_);
  for (auto& step : steps_) {
    for (auto& element : step.elements()) element->bind(state_);
  }
  evaluate_dependencies();

  bool has_input = !steps_[0].empty() && active_element().is_input();
  if (!has_input) has_input = !move_focus_forward();
  if (!has_input) {
    // nothing to edit: show every step once
    active_step_ = steps_.size() - 1;
    active_element_ = 0;
    outcome_ = FormOutcome::Completed;
  } else {
    set_focus(true);
  }

  if (!render(coordinator, true, msg)) {
    spdlog::error("form: first render failed: {}", msg);
    return false;
  }

  while (outcome_ == FormOutcome::Pending) {
    auto key = input.read_key();
    if (!key) {
      outcome_ = FormOutcome::Cancelled;
      break;
    }
    handle_key(*key);
    bool changed = evaluate_dependencies();
    if (!render(coordinator, changed, msg)) {
      spdlog::error("form: render failed: {}", msg);
      return false;
    }
  }

  interface.advance_to_end();
  spdlog::info("form: finished ({})", outcome_ == FormOutcome::Completed ? "completed" : "cancelled");
  return true;
}

std::string Form::result() const {
  std::string out;
  for (const auto& step : steps_) {
    for (const auto& element : step.elements()) out += element->value();
    out.push_back('\n');
  }
  return out;
}
