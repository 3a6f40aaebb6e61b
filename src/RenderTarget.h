#pragma once

#include <cstdint>
#include <vector>
#include "Color.h"

// The raster primitives shapes need. Coordinates are canvas space.
class RenderTarget {
  public:
    virtual ~RenderTarget() {}
    virtual int  width()  const = 0;
    virtual int  height() const = 0;

    // Reset the area to fully transparent.
    virtual void clearRect(double x, double y, double w, double h) = 0;
    // Negative w/h extend the box left/up from (x, y).
    virtual void fillRect (double x, double y, double w, double h, const Color& color) = 0;
    // Filled pie slice; a sweep of 2*pi or more is a full disc. Angles in radians.
    virtual void fillArc  (double cx, double cy, double radius,
                           double startAngle, double endAngle, const Color& color) = 0;

    // ARGB8888, row-major, width()*height() pixels. False if unreadable.
    virtual bool readPixels(std::vector<uint32_t>& out) const { return false; }
};
