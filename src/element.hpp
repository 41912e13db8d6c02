#pragma once
/*
 * Element
 *
 * Purpose: a unit of form content (static text, text input, custom) rendered through the Coordinator.
 * Lifecycle: set_id once at initialization; per frame render(), then update_layout() with the painted geometry.
 * Constraint: render may be skipped on any frame, so implementations re-derive their own diff.
 */
#include <optional>
#include <string>
#include "input.hpp"
#include "types.hpp"

class Coordinator;
class DependencyState;
class LayoutAccessor;

class Element {
public:
  virtual ~Element() = default;

  // Assigned once by the Coordinator; a second assignment throws std::logic_error.
  void set_id(ElementId id);
  const ElementId& id() const;
  bool has_id() const { return id_.has_value(); }

  void set_focused(bool focused) { focused_ = focused; }
  bool focused() const { return focused_; }

  // Returns false with msg set when the buffer no longer matches the element's bookkeeping.
  virtual bool render(Coordinator& coordinator, std::string& msg) = 0;
  virtual void update_layout(const LayoutAccessor& accessor) = 0;
  virtual bool is_input() const = 0;
  virtual bool captures_enter() const = 0;
  // Returns whether the form should advance focus.
  virtual bool update(const Key& key) = 0;

  // Text contributed to the form result.
  virtual std::string value() const { return std::string(); }
  // Publish this element's evaluations; returns whether any result changed.
  virtual bool evaluate(DependencyState&) const { return false; }
  virtual void bind(const DependencyState&) {}

private:
  std::optional<ElementId> id_;
  bool focused_ = false;
};
