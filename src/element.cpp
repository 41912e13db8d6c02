#include "element.hpp"
#include <stdexcept>

void Element::set_id(ElementId id) {
  if (id_) throw std::logic_error("element: id already assigned");
  id_ = id;
}

const ElementId& Element::id() const {
  if (!id_) throw std::logic_error("element: used before the form was initialized");
  return *id_;
}
