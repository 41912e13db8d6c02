#pragma once
/*
 * Dependency
 *
 * Purpose: conditional visibility between elements. A source element publishes an evaluation
 *          result under a DependencyId; dependents hide or show themselves from that result.
 * Note: ids come from a DependencySequence owned by whoever builds the form.
 */
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include "types.hpp"

struct DependencyId {
  std::uint64_t value = 0;
  bool operator==(const DependencyId&) const = default;
};

template <>
struct std::hash<DependencyId> {
  std::size_t operator()(const DependencyId& id) const noexcept { return std::hash<std::uint64_t>{}(id.value); }
};

class DependencySequence {
public:
  DependencyId next() { return DependencyId{seq_.next()}; }
private:
  IdSequence seq_;
};

struct Evaluation {
  enum class Kind { IsEmpty, Equal, NotEqual };
  Kind kind = Kind::IsEmpty;
  std::string operand;

  static Evaluation is_empty() { return Evaluation{Kind::IsEmpty, std::string()}; }
  static Evaluation equal(std::string v) { return Evaluation{Kind::Equal, std::move(v)}; }
  static Evaluation not_equal(std::string v) { return Evaluation{Kind::NotEqual, std::move(v)}; }

  bool evaluate(const std::string& source) const;
};

// Hide: hidden while the evaluation holds. Show: shown only while it holds.
enum class Action { Hide, Show };

bool is_hidden(Action action, bool evaluation);

class DependencyState {
public:
  void register_source(DependencyId id, ElementId source) { sources_[id] = source; }
  std::optional<ElementId> get_source(DependencyId id) const;
  // Returns whether the stored result changed.
  bool update_evaluation(DependencyId id, bool value);
  bool get_evaluation(DependencyId id) const;
private:
  std::unordered_map<DependencyId, bool> evaluations_;
  std::unordered_map<DependencyId, ElementId> sources_;
};
