#pragma once

#include <cstddef>
#include <vector>
#include "Shape.h"

// Undo/redo over the committed shape list. committed() is the drawing,
// oldest first; undone() is the redo buffer, most recently undone last.
class History {
  public:
    // Append a new shape; discards the redo buffer.
    void push(const Shape& s);
    // Move the newest committed shape to the redo buffer. False if empty.
    bool undo(Shape* out = nullptr);
    // Move the newest undone shape back onto committed. False if empty.
    bool redo(Shape* out = nullptr);
    void clear();

    const std::vector<Shape>& committed() const { return committedStack; }
    const std::vector<Shape>& undone()    const { return undoneStack; }

    bool        canUndo()   const { return !committedStack.empty(); }
    bool        canRedo()   const { return !undoneStack.empty(); }
    std::size_t undoCount() const { return committedStack.size(); }
    std::size_t redoCount() const { return undoneStack.size(); }

  private:
    std::vector<Shape> committedStack;
    std::vector<Shape> undoneStack;
};
