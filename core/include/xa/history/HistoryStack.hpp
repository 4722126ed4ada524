#pragma once
#include "xa/annotation/Annotation.hpp"
#include <cstddef>
#include <vector>

namespace xa {

// Linear undo/redo over full snapshots of the annotation collection.
// entries_[index_] is always the snapshot matching the live collection.
class HistoryStack {
public:
  HistoryStack();

  // Truncates every entry after the current index, appends the snapshot
  // and makes it current.
  void push(AnnotationList snapshot);

  // Step back/forward. Returns false at the bounds.
  bool undo();
  bool redo();

  bool canUndo() const { return index_ > 0; }
  bool canRedo() const { return index_ + 1 < entries_.size(); }

  // Back to [[]] at index 0 (new image).
  void reset();
  // Back to [snapshot] at index 0 (collection loaded from persistence).
  void reset(AnnotationList snapshot);

  const AnnotationList& current() const { return entries_[index_]; }
  std::size_t index() const { return index_; }
  std::size_t size() const { return entries_.size(); }
  std::size_t undoCount() const { return index_; }
  std::size_t redoCount() const { return entries_.size() - index_ - 1; }

private:
  std::vector<AnnotationList> entries_;
  std::size_t index_{0};
};

} // namespace xa
