#include "Tools.h"

void Tool::rectStart(double x, double y) {
    rect.anchored = true;
    rect.anchorX  = x;
    rect.anchorY  = y;
}

void Tool::rectMove(double x, double y) {
    if (!rect.anchored) return;
    Shape candidate = Shape::rect(rect.anchorX, rect.anchorY, x, y, primary);
    if (preview) preview(&candidate);
}

void Tool::rectEnd(double x, double y) {
    if (!rect.anchored) return;
    rect.anchored = false;
    if (preview) preview(nullptr);
    if (commit) commit(Shape::rect(rect.anchorX, rect.anchorY, x, y, primary));
}

void Tool::rectCancel() {
    if (!rect.anchored) return;
    rect.anchored = false;
    if (preview) preview(nullptr);
}
