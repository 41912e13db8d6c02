#pragma once
/*
 * Form
 *
 * Purpose: drive a multi-step form: focus navigation, key dispatch, and the per-event
 *          render -> apply -> layout-feedback cycle through the Coordinator.
 * Keys: Enter advances (unless the element captures it), Esc retreats, Ctrl-C cancels.
 * Render: a pass covers the focused element plus the one that just lost focus.
 * Errors: execute() returns false with msg when a render or paint fails.
 */
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include "dependency.hpp"
#include "input.hpp"
#include "step.hpp"

class Coordinator;
class Interface;

enum class FormOutcome { Pending, Completed, Cancelled };

class Form {
public:
  Form() = default;
  explicit Form(std::vector<Step> steps) : steps_(std::move(steps)) {}

  void add_step(Step step) { steps_.push_back(std::move(step)); }
  const std::vector<Step>& steps() const { return steps_; }
  std::vector<Step>& steps() { return steps_; }
  const Step& get_step(std::size_t index) const { return steps_.at(index); }
  Step& get_step(std::size_t index) { return steps_.at(index); }
  const Element& get_element(std::size_t step_index, std::size_t element_index) const;

  bool execute(Interface& interface, IInputDevice& input, std::string& msg);

  FormOutcome outcome() const { return outcome_; }
  // Every step's element values, one line per step.
  std::string result() const;
  ElementId active() const { return ElementId{active_step_, active_element_}; }
  const DependencyState& dependency_state() const { return state_; }

private:
  Element& active_element();
  const Element& active_element() const;
  bool move_focus_forward();
  bool move_focus_backward();
  void set_focus(bool focused);
  void handle_key(const Key& key);
  bool evaluate_dependencies();
  bool render(Coordinator& coordinator, bool full, std::string& msg);

  std::vector<Step> steps_;
  DependencyState state_;
  std::size_t active_step_ = 0;
  std::size_t active_element_ = 0;
  std::size_t max_step_ = 0;
  // focus as of the last render pass
  ElementId painted_focus_;
  FormOutcome outcome_ = FormOutcome::Pending;
};
