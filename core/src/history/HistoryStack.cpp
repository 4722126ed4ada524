#include "xa/history/HistoryStack.hpp"

namespace xa {

HistoryStack::HistoryStack() {
  reset();
}

void HistoryStack::push(AnnotationList snapshot) {
  entries_.resize(index_ + 1);
  entries_.push_back(std::move(snapshot));
  index_ = entries_.size() - 1;
}

bool HistoryStack::undo() {
  if (!canUndo()) return false;
  --index_;
  return true;
}

bool HistoryStack::redo() {
  if (!canRedo()) return false;
  ++index_;
  return true;
}

void HistoryStack::reset() {
  reset(AnnotationList{});
}

void HistoryStack::reset(AnnotationList snapshot) {
  entries_.clear();
  entries_.push_back(std::move(snapshot));
  index_ = 0;
}

} // namespace xa
