#include "line.hpp"
#include <stdexcept>
#include <string>

Line::Line(LineId id, IdSequence& segment_ids) : id_(id), segment_ids_(&segment_ids) {}

std::vector<SegmentId> Line::segment_ids() const {
  std::vector<SegmentId> ids;
  ids.reserve(segments_.size());
  for (const auto& s : segments_) ids.push_back(s.identifier());
  return ids;
}

const Segment& Line::segment_at(std::size_t index) const {
  if (index >= segments_.size()) throw std::out_of_range("line: segment index " + std::to_string(index) + " out of range");
  return segments_[index];
}

Segment& Line::add_segment() {
  return insert_segment(segments_.size());
}

Segment& Line::insert_segment(std::size_t index) {
  if (index > segments_.size()) throw std::out_of_range("line: insert index " + std::to_string(index) + " out of range");
  auto it = segments_.insert(segments_.begin() + static_cast<std::ptrdiff_t>(index), Segment(SegmentId{segment_ids_->next()}));
  return *it;
}

std::size_t Line::require_index(SegmentId id) const {
  auto idx = get_segment_index(id);
  if (!idx) throw std::out_of_range("line: unknown segment " + std::to_string(id.value));
  return *idx;
}

const Segment& Line::get_segment(SegmentId id) const { return segments_[require_index(id)]; }
Segment& Line::get_segment(SegmentId id) { return segments_[require_index(id)]; }

std::vector<const Segment*> Line::get_segments(const std::vector<SegmentId>& ids) const {
  std::vector<const Segment*> out;
  out.reserve(ids.size());
  for (SegmentId id : ids) out.push_back(&get_segment(id));
  return out;
}

std::optional<std::size_t> Line::get_segment_index(SegmentId id) const {
  for (std::size_t i = 0; i < segments_.size(); ++i) {
    if (segments_[i].identifier() == id) return i;
  }
  return std::nullopt;
}

void Line::remove_segment(SegmentId id) {
  segments_.erase(segments_.begin() + static_cast<std::ptrdiff_t>(require_index(id)));
}

void Line::remove_segment_at(std::size_t index) {
  if (index >= segments_.size()) throw std::out_of_range("line: remove index " + std::to_string(index) + " out of range");
  segments_.erase(segments_.begin() + static_cast<std::ptrdiff_t>(index));
}

Segment Line::take_segment(SegmentId id) {
  std::size_t idx = require_index(id);
  Segment s = std::move(segments_[idx]);
  segments_.erase(segments_.begin() + static_cast<std::ptrdiff_t>(idx));
  return s;
}

void Line::push_segment(Segment segment) { segments_.push_back(std::move(segment)); }
