#define _USE_MATH_DEFINES
#include "Shape.h"
#include <algorithm>
#include <cmath>

Shape Shape::circle(double cx, double cy, double radius, Color color) {
    return Shape(ShapeType::CIRCLE, cx, cy, cx, cy, std::max(0.0, radius), color);
}

Shape Shape::rect(double x0, double y0, double x1, double y1, Color color) {
    return Shape(ShapeType::RECT, x0, y0, x1, y1, 0.0, color);
}

ShapeBounds Shape::bounds() const {
    switch (kind) {
        case ShapeType::CIRCLE:
            return { ax - r, ay - r, ax + r, ay + r };
        case ShapeType::RECT:
            return { std::min(ax, bx), std::min(ay, by), std::max(ax, bx), std::max(ay, by) };
    }
    return { 0, 0, 0, 0 };
}

void Shape::render(RenderTarget& target) const {
    switch (kind) {
        case ShapeType::CIRCLE:
            target.fillArc(ax, ay, r, 0.0, 2.0 * M_PI, fill);
            break;
        case ShapeType::RECT:
            // Signed extents; the target flips negative ones.
            target.fillRect(ax, ay, bx - ax, by - ay, fill);
            break;
    }
}

bool Shape::operator==(const Shape& o) const {
    if (kind != o.kind || fill != o.fill) return false;
    switch (kind) {
        case ShapeType::CIRCLE:
            return ax == o.ax && ay == o.ay && r == o.r;
        case ShapeType::RECT: {
            ShapeBounds a = bounds(), b = o.bounds();
            return a.minX == b.minX && a.minY == b.minY && a.maxX == b.maxX && a.maxY == b.maxY;
        }
    }
    return false;
}
