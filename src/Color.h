#pragma once

#include <SDL2/SDL.h>
#include <cstdint>
#include <string>

enum class ColorParseError { OK, INVALID_FORMAT, INVALID_COMPONENT };

const char* parseErrorString(ColorParseError err);

// Immutable RGB color with an optional normalized alpha.
class Color {
  public:
    Color() {}
    Color(uint8_t r, uint8_t g, uint8_t b) : red(r), green(g), blue(b) {}
    // alpha is clamped into [0, 1]
    Color(uint8_t r, uint8_t g, uint8_t b, float alpha);

    uint8_t r() const { return red; }
    uint8_t g() const { return green; }
    uint8_t b() const { return blue; }
    bool    hasAlpha() const { return alphaSet; }
    float   alpha()    const { return alphaSet ? alphaValue : 1.f; }

    // Accepts "#RRGGBB" or "#RRGGBBAA" (any number of leading '#').
    // out is only written on success.
    static ColorParseError parseHex(const std::string& hex, Color& out);

    // "rgb(r, g, b)" or "rgba(r, g, b, a)"
    std::string toCssString() const;
    // "#rrggbb" or "#rrggbbaa"
    std::string toHexString() const;
    SDL_Color   toSDLColor()  const;

    bool operator==(const Color& o) const;
    bool operator!=(const Color& o) const { return !(*this == o); }

  private:
    uint8_t red = 0, green = 0, blue = 0;
    bool    alphaSet   = false;
    float   alphaValue = 1.f;
};
