#pragma once
/*
 * YesNoInput
 *
 * Purpose: a yes/no toggle rendered as "prefix: Yes" / "prefix: No" on the inline line.
 * Keys: Up/Down toggle, 'y' and 'n' answer directly.
 * Omit: with omit_if_no, a "No" answer is dimmed while focused, blank otherwise, and left out of
 *       the result.
 */
#include <optional>
#include <string>
#include <utility>
#include "dependency.hpp"
#include "element.hpp"

class YesNoInput : public Element {
public:
  explicit YesNoInput(std::string prefix, bool omit_if_no = true);

  bool answer() const { return answer_; }
  void set_answer(bool answer) { answer_ = answer; }
  // Evaluated against "Yes" or "No".
  void set_evaluation(DependencyId id, Evaluation evaluation);

  bool render(Coordinator& coordinator, std::string& msg) override;
  void update_layout(const LayoutAccessor&) override {}
  bool is_input() const override { return true; }
  bool captures_enter() const override { return false; }
  bool update(const Key& key) override;
  std::string value() const override;
  bool evaluate(DependencyState& state) const override;

private:
  const char* answer_text() const { return answer_ ? "Yes" : "No"; }
  bool omitted() const { return omit_if_no_ && !answer_; }

  std::string prefix_;
  bool omit_if_no_;
  bool answer_ = false;
  std::optional<std::pair<DependencyId, Evaluation>> evaluation_;
  std::optional<SegmentId> segment_id_;
};
