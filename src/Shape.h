#pragma once

#include "Color.h"
#include "RenderTarget.h"

enum class ShapeType { CIRCLE, RECT };

struct ShapeBounds {
    double minX, minY, maxX, maxY;
};

// Immutable drawable primitive. Create through circle() / rect().
class Shape {
  public:
    static Shape circle(double cx, double cy, double radius, Color color);
    // Corners in any order.
    static Shape rect(double x0, double y0, double x1, double y1, Color color);

    ShapeType type()  const { return kind; }
    Color     color() const { return fill; }

    // CIRCLE: center and radius. RECT: the two corners as given.
    double x0()     const { return ax; }
    double y0()     const { return ay; }
    double x1()     const { return bx; }
    double y1()     const { return by; }
    double radius() const { return r; }

    ShapeBounds bounds() const;
    void render(RenderTarget& target) const;

    // Rectangles compare by their normalized corners.
    bool operator==(const Shape& o) const;
    bool operator!=(const Shape& o) const { return !(*this == o); }

  private:
    Shape(ShapeType t, double ax, double ay, double bx, double by, double r, Color c)
        : kind(t), ax(ax), ay(ay), bx(bx), by(by), r(r), fill(c) {}

    ShapeType kind;
    double    ax, ay, bx, by;
    double    r;
    Color     fill;
};
