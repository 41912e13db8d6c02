#pragma once
/*
 * SelectInput
 *
 * Purpose: pick one of a fixed list of options with Up/Down (wrapping at both ends).
 * Render: the selected value sits on the inline line; while focused, a drawer of block lines
 *         below it shows the prompt and every option, the selected one marked with '>'.
 */
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "dependency.hpp"
#include "element.hpp"

struct SelectOption {
  std::string value;
  std::string description;
};

class SelectInput : public Element {
public:
  // Throws std::invalid_argument when options is empty.
  SelectInput(std::string prompt, std::vector<SelectOption> options);

  const std::string& prompt() const { return prompt_; }
  const std::vector<SelectOption>& options() const { return options_; }
  std::size_t selected() const { return selected_; }
  // Throws std::out_of_range past the last option.
  void select(std::size_t index);
  void set_evaluation(DependencyId id, Evaluation evaluation);

  bool render(Coordinator& coordinator, std::string& msg) override;
  void update_layout(const LayoutAccessor&) override {}
  bool is_input() const override { return true; }
  bool captures_enter() const override { return false; }
  bool update(const Key& key) override;
  std::string value() const override { return options_[selected_].value; }
  bool evaluate(DependencyState& state) const override;

private:
  void show_drawer(Coordinator& coordinator);
  void hide_drawer(Coordinator& coordinator);

  std::string prompt_;
  std::vector<SelectOption> options_;
  std::size_t selected_ = 0;
  std::optional<std::pair<DependencyId, Evaluation>> evaluation_;
  std::optional<SegmentId> segment_id_;
  std::vector<LineId> drawer_;
  std::vector<SegmentId> drawer_segments_;
};
