#include "dependency.hpp"

bool Evaluation::evaluate(const std::string& source) const {
  switch (kind) {
    case Kind::IsEmpty: return source.empty();
    case Kind::Equal: return source == operand;
    case Kind::NotEqual: return source != operand;
  }
  return false;
}

bool is_hidden(Action action, bool evaluation) {
  return action == Action::Hide ? evaluation : !evaluation;
}

std::optional<ElementId> DependencyState::get_source(DependencyId id) const {
  auto it = sources_.find(id);
  if (it == sources_.end()) return std::nullopt;
  return it->second;
}

bool DependencyState::update_evaluation(DependencyId id, bool value) {
  auto it = evaluations_.find(id);
  if (it != evaluations_.end() && it->second == value) return false;
  evaluations_[id] = value;
  return true;
}

bool DependencyState::get_evaluation(DependencyId id) const {
  auto it = evaluations_.find(id);
  return it != evaluations_.end() && it->second;
}
