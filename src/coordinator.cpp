#include "coordinator.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "step.hpp"

static std::string describe(const ElementId& id) {
  return "(" + std::to_string(id.step_index) + "," + std::to_string(id.element_index) + ")";
}

// Members of the group declared after `element`.
static std::vector<ElementId> subsequent_elements(const std::vector<ElementId>& group, const ElementId& element) {
  auto it = std::find(group.begin(), group.end(), element);
  if (it == group.end()) return {};
  return std::vector<ElementId>(it + 1, group.end());
}

Coordinator::Coordinator(Interface& interface) : interface_(interface) {}

void Coordinator::initialize_elements(std::vector<Step>& steps) {
  if (!elements_.empty()) throw std::logic_error("coordinator: elements already initialized");
  for (std::size_t step_index = 0; step_index < steps.size(); ++step_index) {
    LineId inline_line = interface_.add_line().identifier();
    auto& line_elements = inline_lines_[inline_line];
    auto& elements = steps[step_index].elements();
    for (std::size_t element_index = 0; element_index < elements.size(); ++element_index) {
      ElementId id{step_index, element_index};
      elements[element_index]->set_id(id);
      elements_.emplace(id, ElementData{inline_line, {}, {}});
      line_elements.push_back(id);
    }
  }
  spdlog::debug("coordinator: initialized {} elements over {} steps", elements_.size(), steps.size());
}

void Coordinator::set_cursor(const RelativePosition& cursor) { interface_.set_cursor(cursor); }

void Coordinator::hide_cursor() { interface_.hide_cursor(); }

bool Coordinator::apply_changes(InterfaceLayout& layout, std::string& msg) {
  return interface_.apply_changes(layout, msg);
}

Coordinator::ElementData& Coordinator::data(const ElementId& element) {
  auto it = elements_.find(element);
  if (it == elements_.end()) throw std::out_of_range("coordinator: unknown element " + describe(element));
  return it->second;
}

const Coordinator::ElementData& Coordinator::data(const ElementId& element) const {
  auto it = elements_.find(element);
  if (it == elements_.end()) throw std::out_of_range("coordinator: unknown element " + describe(element));
  return it->second;
}

std::size_t Coordinator::line_index(LineId line) const {
  auto idx = interface_.get_line_index(line);
  if (!idx) throw std::out_of_range("coordinator: line " + std::to_string(line.value) + " is not in the buffer");
  return *idx;
}

std::vector<const Segment*> Coordinator::segments(const ElementId& element) const {
  const ElementData& d = data(element);
  return interface_.get_line(d.inline_line_id).get_segments(d.segment_ids);
}

const Segment& Coordinator::get_segment(const ElementId& element, SegmentId segment) const {
  const ElementData& d = data(element);
  if (std::find(d.segment_ids.begin(), d.segment_ids.end(), segment) == d.segment_ids.end())
    throw std::out_of_range("coordinator: element " + describe(element) + " does not own segment " + std::to_string(segment.value));
  return interface_.get_line(d.inline_line_id).get_segment(segment);
}

Segment& Coordinator::get_segment(const ElementId& element, SegmentId segment) {
  const ElementData& d = data(element);
  if (std::find(d.segment_ids.begin(), d.segment_ids.end(), segment) == d.segment_ids.end())
    throw std::out_of_range("coordinator: element " + describe(element) + " does not own segment " + std::to_string(segment.value));
  return interface_.get_line(d.inline_line_id).get_segment(segment);
}

LineId Coordinator::get_inline_line_id(const ElementId& element) const {
  return data(element).inline_line_id;
}

Segment& Coordinator::add_segment(const ElementId& element) {
  std::size_t index = get_element_segment_index(element) + data(element).segment_ids.size();
  ElementData& d = data(element);
  Segment& segment = interface_.get_line(d.inline_line_id).insert_segment(index);
  d.segment_ids.push_back(segment.identifier());
  return segment;
}

Segment& Coordinator::insert_segment(const ElementId& element, std::size_t index) {
  if (index > data(element).segment_ids.size())
    throw std::out_of_range("coordinator: segment index " + std::to_string(index) + " out of range for " + describe(element));
  std::size_t absolute = get_element_segment_index(element) + index;
  ElementData& d = data(element);
  Segment& segment = interface_.get_line(d.inline_line_id).insert_segment(absolute);
  d.segment_ids.insert(d.segment_ids.begin() + static_cast<std::ptrdiff_t>(index), segment.identifier());
  return segment;
}

void Coordinator::remove_segment(const ElementId& element, SegmentId segment) {
  ElementData& d = data(element);
  auto it = std::find(d.segment_ids.begin(), d.segment_ids.end(), segment);
  if (it == d.segment_ids.end())
    throw std::out_of_range("coordinator: element " + describe(element) + " does not own segment " + std::to_string(segment.value));
  interface_.get_line(d.inline_line_id).remove_segment(segment);
  d.segment_ids.erase(it);
}

void Coordinator::remove_segment_at(const ElementId& element, std::size_t index) {
  ElementData& d = data(element);
  if (index >= d.segment_ids.size())
    throw std::out_of_range("coordinator: segment index " + std::to_string(index) + " out of range for " + describe(element));
  std::size_t absolute = get_element_segment_index(element) + index;
  interface_.get_line(d.inline_line_id).remove_segment_at(absolute);
  d.segment_ids.erase(d.segment_ids.begin() + static_cast<std::ptrdiff_t>(index));
}

std::vector<const Line*> Coordinator::lines(const ElementId& element) const {
  return interface_.get_lines(data(element).block_line_ids);
}

const Line& Coordinator::get_line(const ElementId& element, LineId line) const {
  const ElementData& d = data(element);
  if (std::find(d.block_line_ids.begin(), d.block_line_ids.end(), line) == d.block_line_ids.end())
    throw std::out_of_range("coordinator: element " + describe(element) + " does not own line " + std::to_string(line.value));
  return interface_.get_line(line);
}

Line& Coordinator::get_line(const ElementId& element, LineId line) {
  const ElementData& d = data(element);
  if (std::find(d.block_line_ids.begin(), d.block_line_ids.end(), line) == d.block_line_ids.end())
    throw std::out_of_range("coordinator: element " + describe(element) + " does not own line " + std::to_string(line.value));
  return interface_.get_line(line);
}

Line& Coordinator::add_line(const ElementId& element) {
  if (data(element).block_line_ids.empty()) try_inline_split(element);

  const ElementData& before = data(element);
  std::size_t index = before.block_line_ids.empty() ? get_element_line_index(element)
                                                     : line_index(before.block_line_ids.back()) + 1;
  Line& line = interface_.insert_line(index);
  data(element).block_line_ids.push_back(line.identifier());
  return line;
}

Line& Coordinator::insert_line(const ElementId& element, std::size_t index) {
  if (index > data(element).block_line_ids.size())
    throw std::out_of_range("coordinator: line index " + std::to_string(index) + " out of range for " + describe(element));
  if (data(element).block_line_ids.empty()) try_inline_split(element);

  const ElementData& before = data(element);
  std::size_t absolute = before.block_line_ids.empty() ? get_element_line_index(element)
                                                        : line_index(before.block_line_ids.front()) + index;
  Line& line = interface_.insert_line(absolute);
  ElementData& d = data(element);
  d.block_line_ids.insert(d.block_line_ids.begin() + static_cast<std::ptrdiff_t>(index), line.identifier());
  return line;
}

void Coordinator::remove_line(const ElementId& element, LineId line) {
  const ElementData& before = data(element);
  if (std::find(before.block_line_ids.begin(), before.block_line_ids.end(), line) == before.block_line_ids.end())
    throw std::out_of_range("coordinator: element " + describe(element) + " does not own line " + std::to_string(line.value));

  // The join looks past the block line, so it runs while the line is still in place.
  if (before.block_line_ids.size() == 1) join_following(element, 1);

  interface_.remove_line(line);
  ElementData& d = data(element);
  d.block_line_ids.erase(std::find(d.block_line_ids.begin(), d.block_line_ids.end(), line));
}

void Coordinator::remove_line_at(const ElementId& element, std::size_t index) {
  const ElementData& d = data(element);
  if (index >= d.block_line_ids.size())
    throw std::out_of_range("coordinator: line index " + std::to_string(index) + " out of range for " + describe(element));
  remove_line(element, d.block_line_ids[index]);
}

void Coordinator::try_inline_split(const ElementId& element) {
  const ElementData& d = data(element);
  std::size_t next_segment_index = get_element_segment_index(element) + d.segment_ids.size();

  LineId line_id = d.inline_line_id;
  auto subsequent = subsequent_elements(inline_lines_.at(line_id), element);
  if (subsequent.empty()) return;

  LineId new_line_id = split_line(line_id, next_segment_index);

  auto& group = inline_lines_.at(line_id);
  group.erase(group.end() - static_cast<std::ptrdiff_t>(subsequent.size()), group.end());

  for (const ElementId& moved : subsequent) data(moved).inline_line_id = new_line_id;
  spdlog::debug("coordinator: split line {} after element {}, {} elements moved to line {}",
                line_id.value, describe(element), subsequent.size(), new_line_id.value);
  inline_lines_.emplace(new_line_id, std::move(subsequent));
}

LineId Coordinator::split_line(LineId line, std::size_t split_index) {
  std::size_t index = line_index(line);
  LineId new_line_id = interface_.insert_line(index + 1).identifier();

  auto ids = interface_.get_line(line).segment_ids();
  for (std::size_t i = split_index; i < ids.size(); ++i) {
    interface_.move_segment(ids[i], line, new_line_id);
  }
  return new_line_id;
}

void Coordinator::try_inline_join(const ElementId& element) {
  const ElementData& d = data(element);
  if (!d.block_line_ids.empty()) {
    spdlog::debug("coordinator: element {} still owns {} block lines, join skipped",
                  describe(element), d.block_line_ids.size());
    return;
  }
  join_following(element, 0);
}

void Coordinator::join_following(const ElementId& element, std::size_t block_lines) {
  LineId before_id = data(element).inline_line_id;
  std::size_t following = line_index(before_id) + 1 + block_lines;

  if (interface_.line_count() <= following) return;

  LineId after_id = interface_.line_at(following).identifier();
  auto it = inline_lines_.find(after_id);
  if (it == inline_lines_.end() || it->second.empty()) return;
  // Lines of different steps never merge.
  if (it->second.front().step_index != element.step_index) return;

  join_inline_lines(before_id, after_id);

  std::vector<ElementId> moved = std::move(it->second);
  inline_lines_.erase(it);
  for (const ElementId& m : moved) data(m).inline_line_id = before_id;

  auto& group = inline_lines_.at(before_id);
  spdlog::debug("coordinator: joined line {} into line {} after element {}, {} elements moved",
                after_id.value, before_id.value, describe(element), moved.size());
  group.insert(group.end(), moved.begin(), moved.end());
}

void Coordinator::join_inline_lines(LineId first, LineId second) {
  for (SegmentId id : interface_.get_line(second).segment_ids()) {
    interface_.move_segment(id, second, first);
  }
  interface_.remove_line(second);
}

std::size_t Coordinator::get_element_segment_index(const ElementId& element) const {
  const ElementData& d = data(element);
  std::size_t count = 0;
  for (const ElementId& sibling : inline_lines_.at(d.inline_line_id)) {
    if (sibling == element) break;
    count += data(sibling).segment_ids.size();
  }
  return count;
}

std::size_t Coordinator::get_element_line_index(const ElementId& element) const {
  if (!elements_.count(element)) throw std::out_of_range("coordinator: unknown element " + describe(element));

  std::optional<LineId> last_line;
  std::size_t count = 0;
  for (const auto& [id, d] : elements_) {
    if (id > element) break;
    count += d.block_line_ids.size();
    if (last_line != d.inline_line_id) count += 1;
    last_line = d.inline_line_id;
  }
  return count;
}

const std::vector<SegmentId>& Coordinator::segment_ids(const ElementId& element) const {
  return data(element).segment_ids;
}

const std::vector<LineId>& Coordinator::block_line_ids(const ElementId& element) const {
  return data(element).block_line_ids;
}

const std::vector<ElementId>& Coordinator::inline_line_elements(LineId line) const {
  auto it = inline_lines_.find(line);
  if (it == inline_lines_.end()) throw std::out_of_range("coordinator: line " + std::to_string(line.value) + " is not an inline line");
  return it->second;
}

bool Coordinator::verify(std::string& msg) const {
  std::size_t block_total = 0;
  for (const auto& [line_id, group] : inline_lines_) {
    auto idx = interface_.get_line_index(line_id);
    if (!idx) { msg = "inline line " + std::to_string(line_id.value) + " missing from buffer"; return false; }
    if (!std::is_sorted(group.begin(), group.end())) { msg = "inline line " + std::to_string(line_id.value) + " members out of order"; return false; }
    std::vector<SegmentId> expected;
    for (const ElementId& member : group) {
      const ElementData& d = data(member);
      if (d.inline_line_id != line_id) { msg = "element " + describe(member) + " points at another inline line"; return false; }
      expected.insert(expected.end(), d.segment_ids.begin(), d.segment_ids.end());
    }
    if (expected != interface_.line_at(*idx).segment_ids()) {
      msg = "segments of inline line " + std::to_string(line_id.value) + " do not match its members";
      return false;
    }
  }
  for (const auto& [id, d] : elements_) {
    const auto& group = inline_lines_.at(d.inline_line_id);
    if (std::find(group.begin(), group.end(), id) == group.end()) { msg = "element " + describe(id) + " missing from its inline line"; return false; }
    if (d.block_line_ids.empty()) continue;
    if (group.back() != id) { msg = "element " + describe(id) + " has block lines but is not last on its inline line"; return false; }
    std::size_t base = line_index(d.inline_line_id);
    for (std::size_t k = 0; k < d.block_line_ids.size(); ++k) {
      auto idx = interface_.get_line_index(d.block_line_ids[k]);
      if (!idx || *idx != base + 1 + k) { msg = "block lines of element " + describe(id) + " are not contiguous"; return false; }
    }
    block_total += d.block_line_ids.size();
  }
  if (inline_lines_.size() + block_total != interface_.line_count()) {
    msg = "buffer holds lines no element owns";
    return false;
  }
  return true;
}
