#pragma once

#include <SDL2/SDL.h>
#include "RenderTarget.h"

// RenderTarget backed by an ARGB8888 SDL_Surface and a software renderer.
// Needs no window, so it works before SDL_Init and in tests.
//
// With blend off, translucent fills replace pixels instead of blending. An
// overlay that is composited with alpha later needs that, or translucent
// colors get blended twice.
class SdlSurface : public RenderTarget {
  public:
    SdlSurface(int w, int h, bool blend = true);
    ~SdlSurface();
    SdlSurface(const SdlSurface&) = delete;
    SdlSurface& operator=(const SdlSurface&) = delete;

    bool isValid() const { return surface && renderer; }

    int  width()  const override { return w; }
    int  height() const override { return h; }
    void clearRect(double x, double y, double w, double h) override;
    void fillRect (double x, double y, double w, double h, const Color& color) override;
    void fillArc  (double cx, double cy, double radius,
                   double startAngle, double endAngle, const Color& color) override;
    bool readPixels(std::vector<uint32_t>& out) const override;

    // For compositing into a window texture. Flushes pending draw calls first.
    SDL_Surface* getSurface() const;

  private:
    int           w, h;
    bool          blend;
    SDL_Surface*  surface  = nullptr;
    SDL_Renderer* renderer = nullptr;

    void setDrawColor(const Color& color);
};
