#include "Tools.h"
#include "Constants.h"
#include <utility>

const char* toolName(ToolType t) {
    switch (t) {
        case ToolType::BRUSH: return "brush";
        case ToolType::RECT:  return "rect";
    }
    return "unknown";
}

Tool::Tool(ToolType t, Color primary, Color secondary,
           CommitCallback onCommit, PreviewCallback onPreview)
    : kind(t), primary(primary), secondary(secondary),
      commit(std::move(onCommit)), preview(std::move(onPreview)) {
    brush.radius = BRUSH_RADIUS;
}

void Tool::onGestureStart(double x, double y) {
    switch (kind) {
        case ToolType::BRUSH: brushDab(x, y);  break;
        case ToolType::RECT:  rectStart(x, y); break;
    }
}

void Tool::onGestureMove(double x, double y) {
    switch (kind) {
        case ToolType::BRUSH: brushDab(x, y); break;
        case ToolType::RECT:  rectMove(x, y); break;
    }
}

void Tool::onGestureEnd(double x, double y) {
    switch (kind) {
        case ToolType::BRUSH: break;  // every dab is already committed
        case ToolType::RECT:  rectEnd(x, y); break;
    }
}

void Tool::cancel() {
    switch (kind) {
        case ToolType::BRUSH: break;
        case ToolType::RECT:  rectCancel(); break;
    }
}
