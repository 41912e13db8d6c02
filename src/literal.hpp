#pragma once
/*
 * Literal
 *
 * Purpose: static text. The first text line lands on the shared inline line, every further
 *          line on a block line of its own.
 * Dependency: optionally hidden/shown by a DependencyId; hiding releases all of its screen space.
 */
#include <optional>
#include <utility>
#include <string>
#include <vector>
#include "dependency.hpp"
#include "element.hpp"

class Literal : public Element {
public:
  explicit Literal(std::string text, std::optional<Style> style = std::nullopt);

  const std::string& text() const { return text_; }
  void set_dependency(DependencyId id, Action action);
  bool visible() const;

  bool render(Coordinator& coordinator, std::string& msg) override;
  void update_layout(const LayoutAccessor&) override {}
  bool is_input() const override { return false; }
  bool captures_enter() const override { return false; }
  bool update(const Key&) override { return false; }
  std::string value() const override { return visible() ? text_ : std::string(); }
  void bind(const DependencyState& state) override { state_ = &state; }

private:
  void show(Coordinator& coordinator);
  void hide(Coordinator& coordinator);

  std::string text_;
  std::optional<Style> style_;
  std::optional<std::pair<DependencyId, Action>> dependency_;
  const DependencyState* state_ = nullptr;
  bool rendered_ = false;
};
