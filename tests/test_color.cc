// Color: hex parsing and CSS/hex serialization

#include "Color.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
    if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
    // ---- Test 1: six-digit parse ----
    {
        Color c;
        requireTrue(Color::parseHex("#1a2B3c", c) == ColorParseError::OK, "#1a2B3c parses");
        requireTrue(c.r() == 0x1a && c.g() == 0x2b && c.b() == 0x3c, "components decoded");
        requireTrue(!c.hasAlpha(), "no alpha for 6 digits");
        requireTrue(c.toCssString() == "rgb(26, 43, 60)", "css without alpha");

        Color bare;
        requireTrue(Color::parseHex("ff8000", bare) == ColorParseError::OK, "leading # is optional");
        requireTrue(bare == Color(255, 128, 0), "ff8000 decoded");

        Color doubled;
        requireTrue(Color::parseHex("##ff0000", doubled) == ColorParseError::OK, "repeated # stripped");
        requireTrue(doubled == Color(255, 0, 0), "##ff0000 decoded");
        std::printf("  Test 1 (six digits): PASS\n");
    }

    // ---- Test 2: eight-digit parse normalizes alpha ----
    {
        Color c;
        requireTrue(Color::parseHex("#10203080", c) == ColorParseError::OK, "#10203080 parses");
        requireTrue(c.hasAlpha(), "alpha present");
        requireTrue(std::fabs(c.alpha() - 128.f / 255.f) < 1e-6f, "alpha is byte/255");
        requireTrue(c.toCssString() == "rgba(16, 32, 48, 0.501961)", "css with alpha");

        Color opaque, clear;
        requireTrue(Color::parseHex("#000000ff", opaque) == ColorParseError::OK, "opaque parses");
        requireTrue(opaque.alpha() == 1.f, "ff alpha is 1");
        requireTrue(Color::parseHex("#00000000", clear) == ColorParseError::OK, "transparent parses");
        requireTrue(clear.alpha() == 0.f, "00 alpha is 0");
        requireTrue(clear.toCssString() == "rgba(0, 0, 0, 0)", "zero alpha css");
        std::printf("  Test 2 (eight digits): PASS\n");
    }

    // ---- Test 3: round trip for every channel value ----
    {
        for (int v = 0; v < 256; v++) {
            Color src((uint8_t)v, (uint8_t)(255 - v), (uint8_t)(v * 7));
            Color back;
            requireTrue(Color::parseHex(src.toHexString(), back) == ColorParseError::OK, "hex output parses");
            requireTrue(back == src, "round trip keeps rgb");
        }
        requireTrue(Color(1, 2, 3).toHexString() == "#010203", "hex is zero padded");
        requireTrue(Color(255, 255, 255, 1.f).toHexString() == "#ffffffff", "hex includes alpha");
        std::printf("  Test 3 (round trip): PASS\n");
    }

    // ---- Test 4: typed failures leave the output untouched ----
    {
        Color keep(9, 9, 9);
        requireTrue(Color::parseHex("#1234", keep) == ColorParseError::INVALID_FORMAT, "short input");
        requireTrue(Color::parseHex("", keep) == ColorParseError::INVALID_FORMAT, "empty input");
        requireTrue(Color::parseHex("#", keep) == ColorParseError::INVALID_FORMAT, "only #");
        requireTrue(Color::parseHex("#1234567", keep) == ColorParseError::INVALID_FORMAT, "seven digits");
        requireTrue(Color::parseHex("###", keep) == ColorParseError::INVALID_FORMAT, "only #s");
        requireTrue(Color::parseHex("#GGGGGG", keep) == ColorParseError::INVALID_COMPONENT, "non-hex digits");
        requireTrue(Color::parseHex("#12345z", keep) == ColorParseError::INVALID_COMPONENT, "bad blue");
        requireTrue(Color::parseHex("#123456zz", keep) == ColorParseError::INVALID_COMPONENT, "bad alpha");
        requireTrue(Color::parseHex("#+f0000", keep) == ColorParseError::INVALID_COMPONENT, "sign is not a digit");
        requireTrue(keep == Color(9, 9, 9), "output untouched after failures");
        requireTrue(std::string(parseErrorString(ColorParseError::INVALID_FORMAT)) != "ok", "error text");
        std::printf("  Test 4 (failures): PASS\n");
    }

    // ---- Test 5: literal alpha is clamped, SDL conversion ----
    {
        requireTrue(Color(0, 0, 0, 1.5f).alpha() == 1.f, "alpha clamped high");
        requireTrue(Color(0, 0, 0, -0.5f).alpha() == 0.f, "alpha clamped low");
        SDL_Color half = Color(10, 20, 30, 0.5f).toSDLColor();
        requireTrue(half.r == 10 && half.g == 20 && half.b == 30, "sdl rgb");
        requireTrue(half.a == 128, "sdl alpha rounded");
        requireTrue(Color(1, 2, 3).toSDLColor().a == 255, "no alpha is opaque");
        requireTrue(Color(1, 2, 3) != Color(1, 2, 3, 1.f), "alpha presence matters for equality");
        std::printf("  Test 5 (alpha): PASS\n");
    }

    std::printf("color: ALL PASS\n");
    return 0;
}
