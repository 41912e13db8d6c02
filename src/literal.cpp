#include "literal.hpp"
#include <sstream>
#include "coordinator.hpp"

static std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) out.push_back(line);
  if (out.empty()) out.emplace_back();
  return out;
}

Literal::Literal(std::string text, std::optional<Style> style) : text_(std::move(text)), style_(style) {}

void Literal::set_dependency(DependencyId id, Action action) {
  dependency_ = std::make_pair(id, action);
}

bool Literal::visible() const {
  if (!dependency_ || !state_) return true;
  return !is_hidden(dependency_->second, state_->get_evaluation(dependency_->first));
}

bool Literal::render(Coordinator& coordinator, std::string&) {
  bool want = visible();
  if (want && !rendered_) show(coordinator);
  else if (!want && rendered_) hide(coordinator);
  return true;
}

void Literal::show(Coordinator& coordinator) {
  auto lines = split_lines(text_);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    Segment& segment = i == 0 ? coordinator.add_segment(id()) : coordinator.add_line(id()).add_segment();
    segment.set_text(lines[i]);
    if (style_) segment.set_style(*style_);
  }
  rendered_ = true;
}

void Literal::hide(Coordinator& coordinator) {
  while (!coordinator.block_line_ids(id()).empty()) {
    coordinator.remove_line_at(id(), coordinator.block_line_ids(id()).size() - 1);
  }
  while (!coordinator.segment_ids(id()).empty()) {
    coordinator.remove_segment_at(id(), 0);
  }
  rendered_ = false;
}
