#define _USE_MATH_DEFINES
#include <vector>
#include <cmath>
#include <algorithm>

#include "DrawingUtils.h"

#define STB_IMAGE_WRITE_STATIC
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>

namespace DrawingUtils {

// ── Drawing primitives ────────────────────────────────────────────────────────

    void fillDisc(SDL_Renderer* renderer, double cx, double cy, double radius) {
        if (radius <= 0.0) return;
        int rowStart = (int)std::floor(cy - radius);
        int rowEnd   = (int)std::ceil(cy + radius);
        for (int row = rowStart; row <= rowEnd; row++) {
            double dy = row + 0.5 - cy;
            if (std::abs(dy) > radius) continue;
            double half = std::sqrt(radius * radius - dy * dy);
            int x0 = (int)std::ceil (cx - half - 0.5);
            int x1 = (int)std::floor(cx + half - 0.5);
            if (x1 >= x0) SDL_RenderDrawLine(renderer, x0, row, x1, row);
        }
    }

    // Normalize an angle into [0, 2*pi).
    static double wrapAngle(double a) {
        a = std::fmod(a, 2.0 * M_PI);
        return a < 0.0 ? a + 2.0 * M_PI : a;
    }

    void fillSector(SDL_Renderer* renderer, double cx, double cy, double radius,
                    double startAngle, double endAngle) {
        if (radius <= 0.0) return;
        double sweep = endAngle - startAngle;
        if (std::abs(sweep) >= 2.0 * M_PI) { fillDisc(renderer, cx, cy, radius); return; }
        if (sweep < 0.0) { std::swap(startAngle, endAngle); sweep = -sweep; }
        double from = wrapAngle(startAngle);

        int x0 = (int)std::floor(cx - radius), x1 = (int)std::ceil(cx + radius);
        int y0 = (int)std::floor(cy - radius), y1 = (int)std::ceil(cy + radius);
        for (int py = y0; py <= y1; py++) {
            for (int px = x0; px <= x1; px++) {
                double dx = px + 0.5 - cx, dy = py + 0.5 - cy;
                if (dx * dx + dy * dy > radius * radius) continue;
                double rel = wrapAngle(std::atan2(dy, dx) - from);
                if (rel <= sweep) SDL_RenderDrawPoint(renderer, px, py);
            }
        }
    }

    SDL_Rect normalizedRect(double x, double y, double w, double h) {
        int left   = (int)std::lround(std::min(x, x + w));
        int right  = (int)std::lround(std::max(x, x + w));
        int top    = (int)std::lround(std::min(y, y + h));
        int bottom = (int)std::lround(std::max(y, y + h));
        return { left, top, right - left, bottom - top };
    }

// SDL ARGB8888 (0xAARRGGBB) -> stb RGBA8888 (bytes R,G,B,A)

    static std::vector<uint8_t> argbToRGBA(const uint32_t* argb, int w, int h) {
        std::vector<uint8_t> rgba(w * h * 4);
        for (int i = 0; i < w * h; i++) {
            uint32_t px = argb[i];
            rgba[i*4+0] = (px >> 16) & 0xFF; // R
            rgba[i*4+1] = (px >>  8) & 0xFF; // G
            rgba[i*4+2] = (px >>  0) & 0xFF; // B
            rgba[i*4+3] = (px >> 24) & 0xFF; // A
        }
        return rgba;
    }

// ── Encode ────────────────────────────────────────────────────────────────────

    std::vector<uint8_t> encodePNG(const uint32_t* argbPixels, int w, int h) {
        std::vector<uint8_t> out;
        if (!argbPixels || w <= 0 || h <= 0) return out;
        auto rgba = argbToRGBA(argbPixels, w, h);
        auto cb = [](void* ctx, void* data, int size) {
            auto* buf = static_cast<std::vector<uint8_t>*>(ctx);
            auto* bytes = static_cast<uint8_t*>(data);
            buf->insert(buf->end(), bytes, bytes + size);
        };
        if (!stbi_write_png_to_func(cb, &out, w, h, 4, rgba.data(), w * 4))
            out.clear();
        return out;
    }
}
