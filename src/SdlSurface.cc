#include "SdlSurface.h"
#include "DrawingUtils.h"

SdlSurface::SdlSurface(int w, int h, bool blend) : w(w), h(h), blend(blend) {
    surface = SDL_CreateRGBSurfaceWithFormat(0, w, h, 32, SDL_PIXELFORMAT_ARGB8888);
    if (!surface) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SdlSurface: cannot create %dx%d surface: %s",
                     w, h, SDL_GetError());
        return;
    }
    renderer = SDL_CreateSoftwareRenderer(surface);
    if (!renderer) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SdlSurface: cannot create renderer: %s",
                     SDL_GetError());
        SDL_FreeSurface(surface);
        surface = nullptr;
        return;
    }
    clearRect(0, 0, w, h);
}

SdlSurface::~SdlSurface() {
    if (renderer) SDL_DestroyRenderer(renderer);
    if (surface)  SDL_FreeSurface(surface);
}

void SdlSurface::setDrawColor(const Color& color) {
    SDL_Color c = color.toSDLColor();
    SDL_SetRenderDrawBlendMode(renderer, (!blend || c.a == 255) ? SDL_BLENDMODE_NONE : SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
}

void SdlSurface::clearRect(double x, double y, double w, double h) {
    if (!isValid()) return;
    SDL_Rect r = DrawingUtils::normalizedRect(x, y, w, h);
    if (r.w <= 0 || r.h <= 0) return;
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 0);
    SDL_RenderFillRect(renderer, &r);
}

void SdlSurface::fillRect(double x, double y, double w, double h, const Color& color) {
    if (!isValid()) return;
    SDL_Rect r = DrawingUtils::normalizedRect(x, y, w, h);
    if (r.w <= 0 || r.h <= 0) return;
    setDrawColor(color);
    SDL_RenderFillRect(renderer, &r);
}

void SdlSurface::fillArc(double cx, double cy, double radius,
                         double startAngle, double endAngle, const Color& color) {
    if (!isValid()) return;
    setDrawColor(color);
    DrawingUtils::fillSector(renderer, cx, cy, radius, startAngle, endAngle);
}

bool SdlSurface::readPixels(std::vector<uint32_t>& out) const {
    if (!isValid()) return false;
    out.resize((size_t)w * h);
    if (SDL_RenderReadPixels(renderer, nullptr, SDL_PIXELFORMAT_ARGB8888, out.data(), w * 4) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SdlSurface: read failed: %s", SDL_GetError());
        out.clear();
        return false;
    }
    return true;
}

SDL_Surface* SdlSurface::getSurface() const {
    if (renderer) SDL_RenderFlush(renderer);
    return surface;
}
