#pragma once
/*
 * Step
 *
 * Purpose: one form step; its elements share a single inline line until they outgrow it.
 */
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>
#include "element.hpp"

class Step {
public:
  Step() = default;
  explicit Step(std::vector<std::unique_ptr<Element>> elements) : elements_(std::move(elements)) {}

  template <typename T, typename... Args>
  T& emplace(Args&&... args) {
    auto e = std::make_unique<T>(std::forward<Args>(args)...);
    T& ref = *e;
    elements_.push_back(std::move(e));
    return ref;
  }
  void add_element(std::unique_ptr<Element> element) { elements_.push_back(std::move(element)); }

  std::size_t size() const { return elements_.size(); }
  bool empty() const { return elements_.empty(); }
  Element& get_element(std::size_t index) { return *elements_.at(index); }
  const Element& get_element(std::size_t index) const { return *elements_.at(index); }
  std::vector<std::unique_ptr<Element>>& elements() { return elements_; }
  const std::vector<std::unique_ptr<Element>>& elements() const { return elements_; }

private:
  std::vector<std::unique_ptr<Element>> elements_;
};
