#pragma once
/*
 * DynamicElement
 *
 * Purpose: custom element cycling through three layouts with Left/Right, exercising every
 *          Coordinator path: state 0 one inline segment, state 1 an extra leading segment with the
 *          following siblings split off, state 2 a private block line instead.
 */
#include <optional>
#include <string>
#include "element.hpp"

class DynamicElement : public Element {
public:
  explicit DynamicElement(std::string label);

  int state() const { return state_; }
  void set_state(int state);

  bool render(Coordinator& coordinator, std::string& msg) override;
  void update_layout(const LayoutAccessor&) override {}
  bool is_input() const override { return true; }
  bool captures_enter() const override { return false; }
  bool update(const Key& key) override;
  std::string value() const override { return label_ + "S" + std::to_string(state_); }

  static constexpr int kMaxState = 2;

private:
  std::string label_;
  int state_ = 0;
  std::optional<SegmentId> base_;
  std::optional<SegmentId> leading_;
  std::optional<LineId> block_;
};
