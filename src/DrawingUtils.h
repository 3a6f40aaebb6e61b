#pragma once

#include <SDL2/SDL.h>
#include <vector>
#include <cstdint>

// Shared Drawing Helpers. All fills use the renderer's current draw color and
// blend mode, and cover the pixels whose centers fall inside the shape.
namespace DrawingUtils {
    void fillDisc(SDL_Renderer* renderer, double cx, double cy, double radius);
    // Pie slice from startAngle to endAngle (radians, clockwise in screen space).
    // Sweeps of 2*pi or more fall through to fillDisc.
    void fillSector(SDL_Renderer* renderer, double cx, double cy, double radius,
                    double startAngle, double endAngle);

    // Box spanning (x, y) and (x+w, y+h) in either direction, snapped to
    // whole pixels. w/h of the result are never negative.
    SDL_Rect normalizedRect(double x, double y, double w, double h);

    // encodePNG: compress ARGB8888 pixels to PNG bytes. Empty on failure.
    std::vector<uint8_t> encodePNG(const uint32_t* argbPixels, int w, int h);
}
