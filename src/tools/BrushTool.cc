#include "Tools.h"

// One dab per sample. Samples are not joined, so fast strokes leave gaps.
void Tool::brushDab(double x, double y) {
    if (commit) commit(Shape::circle(x, y, brush.radius, primary));
}
