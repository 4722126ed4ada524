// D4.1: HistoryStack snapshot undo/redo

#include "xa/history/HistoryStack.hpp"

#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static xa::AnnotationList listOf(int n) {
  xa::AnnotationList list;
  for (int i = 1; i <= n; ++i) {
    xa::Annotation a;
    a.id = static_cast<xa::Id>(i);
    a.type = xa::AnnotationType::Marker;
    a.points = {{double(i), double(i)}};
    list.push_back(a);
  }
  return list;
}

int main() {
  // ---- Test 1: initial state is [[]] ----
  {
    xa::HistoryStack h;
    requireTrue(h.size() == 1 && h.index() == 0, "one empty entry");
    requireTrue(h.current().empty(), "current empty");
    requireTrue(!h.canUndo() && !h.canRedo(), "nothing to undo/redo");
    requireTrue(!h.undo() && !h.redo(), "undo/redo fail at bounds");
    std::printf("  Test 1 (initial): PASS\n");
  }

  // ---- Test 2: push, undo, redo ----
  {
    xa::HistoryStack h;
    h.push(listOf(1));
    h.push(listOf(2));
    h.push(listOf(3));
    requireTrue(h.size() == 4 && h.index() == 3, "3 pushes");
    requireTrue(h.undoCount() == 3 && h.redoCount() == 0, "counts");

    requireTrue(h.undo(), "undo");
    requireTrue(h.current() == listOf(2), "back to 2");
    requireTrue(h.undo() && h.undo(), "undo twice");
    requireTrue(h.current().empty(), "back to empty");
    requireTrue(!h.undo(), "stop at 0");

    requireTrue(h.redo(), "redo");
    requireTrue(h.current() == listOf(1), "forward to 1");
    requireTrue(h.redoCount() == 2, "2 redoable");
    std::printf("  Test 2 (undo/redo): PASS\n");
  }

  // ---- Test 3: push after undo truncates the redo branch ----
  {
    xa::HistoryStack h;
    h.push(listOf(1));
    h.push(listOf(2));
    h.undo();
    h.push(listOf(5));
    requireTrue(!h.canRedo(), "redo branch dropped");
    requireTrue(h.size() == 3, "[[], 1, 5]");
    requireTrue(h.current() == listOf(5), "current is 5");
    h.undo();
    requireTrue(h.current() == listOf(1), "previous is 1");
    std::printf("  Test 3 (truncate): PASS\n");
  }

  // ---- Test 4: reset ----
  {
    xa::HistoryStack h;
    h.push(listOf(2));
    h.reset(listOf(4));
    requireTrue(h.size() == 1 && h.index() == 0, "single entry");
    requireTrue(h.current() == listOf(4), "loaded snapshot");
    requireTrue(!h.canUndo(), "cannot undo a load");
    h.reset();
    requireTrue(h.current().empty(), "reset to empty");
    std::printf("  Test 4 (reset): PASS\n");
  }

  std::printf("D4.1 history: ALL PASS\n");
  return 0;
}
