#include "Color.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

const char* parseErrorString(ColorParseError err) {
    switch (err) {
        case ColorParseError::OK:                return "ok";
        case ColorParseError::INVALID_FORMAT:    return "invalid hex color format";
        case ColorParseError::INVALID_COMPONENT: return "invalid hex color component";
    }
    return "unknown";
}

Color::Color(uint8_t r, uint8_t g, uint8_t b, float a)
    : red(r), green(g), blue(b), alphaSet(true),
      alphaValue(std::isnan(a) ? 1.f : std::max(0.f, std::min(1.f, a))) {}

static int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Parse the two characters at s[i], s[i+1] as one byte.
static bool hexByte(const std::string& s, size_t i, uint8_t* out) {
    int hi = hexDigit(s[i]), lo = hexDigit(s[i + 1]);
    if (hi < 0 || lo < 0) return false;
    *out = (uint8_t)(hi * 16 + lo);
    return true;
}

ColorParseError Color::parseHex(const std::string& input, Color& out) {
    std::string hex = input.substr(std::min(input.find_first_not_of('#'), input.size()));
    if (hex.size() != 6 && hex.size() != 8)
        return ColorParseError::INVALID_FORMAT;

    uint8_t r, g, b;
    if (!hexByte(hex, 0, &r) || !hexByte(hex, 2, &g) || !hexByte(hex, 4, &b))
        return ColorParseError::INVALID_COMPONENT;

    if (hex.size() == 8) {
        uint8_t a;
        if (!hexByte(hex, 6, &a)) return ColorParseError::INVALID_COMPONENT;
        out = Color(r, g, b, a / 255.f);
    } else {
        out = Color(r, g, b);
    }
    return ColorParseError::OK;
}

std::string Color::toCssString() const {
    char buf[64];
    if (alphaSet)
        snprintf(buf, sizeof(buf), "rgba(%d, %d, %d, %g)", red, green, blue, alphaValue);
    else
        snprintf(buf, sizeof(buf), "rgb(%d, %d, %d)", red, green, blue);
    return buf;
}

std::string Color::toHexString() const {
    char buf[10];
    if (alphaSet)
        snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", red, green, blue,
                 (int)std::lround(alphaValue * 255.f));
    else
        snprintf(buf, sizeof(buf), "#%02x%02x%02x", red, green, blue);
    return buf;
}

SDL_Color Color::toSDLColor() const {
    Uint8 a = alphaSet ? (Uint8)std::lround(alphaValue * 255.f) : 255;
    return {red, green, blue, a};
}

bool Color::operator==(const Color& o) const {
    if (red != o.red || green != o.green || blue != o.blue || alphaSet != o.alphaSet)
        return false;
    return !alphaSet || std::fabs(alphaValue - o.alphaValue) < 1e-6f;
}
