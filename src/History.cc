#include "History.h"
#include <utility>

void History::push(const Shape& s) {
    committedStack.push_back(s);
    undoneStack.clear();
}

bool History::undo(Shape* out) {
    if (committedStack.empty()) return false;
    undoneStack.push_back(std::move(committedStack.back()));
    committedStack.pop_back();
    if (out) *out = undoneStack.back();
    return true;
}

bool History::redo(Shape* out) {
    if (undoneStack.empty()) return false;
    committedStack.push_back(std::move(undoneStack.back()));
    undoneStack.pop_back();
    if (out) *out = committedStack.back();
    return true;
}

void History::clear() {
    committedStack.clear();
    undoneStack.clear();
}
