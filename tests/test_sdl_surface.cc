// SdlSurface pixel output and the full controller pipeline on real surfaces

#include "SdlSurface.h"
#include "CanvasController.h"
#include "RecordingTarget.h"

#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
    if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static uint32_t pixelAt(const std::vector<uint32_t>& px, int w, int x, int y) {
    return px[(size_t)y * w + x];
}

int main() {
    const int W = 64, H = 48;
    const uint32_t TRANSPARENT = 0x00000000u;
    const uint32_t RED   = 0xFFFF0000u;
    const uint32_t BLUE  = 0xFF0000FFu;
    const uint32_t WHITE = 0xFFFFFFFFu;

    // ---- Test 1: new surface is transparent ----
    {
        SdlSurface s(W, H);
        requireTrue(s.isValid(), "surface created");
        requireTrue(s.width() == W && s.height() == H, "dimensions");
        std::vector<uint32_t> px;
        requireTrue(s.readPixels(px), "readable");
        requireTrue(px.size() == (size_t)W * H, "one word per pixel");
        requireTrue(pixelAt(px, W, 0, 0) == TRANSPARENT && pixelAt(px, W, W - 1, H - 1) == TRANSPARENT,
                    "starts transparent");
        std::printf("  Test 1 (fresh surface): PASS\n");
    }

    // ---- Test 2: negative extents cover the same box ----
    {
        SdlSurface a(W, H), b(W, H);
        a.fillRect(10, 10, 20, 15, Color(255, 0, 0));
        b.fillRect(30, 25, -20, -15, Color(255, 0, 0));
        std::vector<uint32_t> pa, pb;
        requireTrue(a.readPixels(pa) && b.readPixels(pb), "readable");
        requireTrue(pa == pb, "identical pixels");
        requireTrue(pixelAt(pa, W, 10, 10) == RED, "top-left inside");
        requireTrue(pixelAt(pa, W, 29, 24) == RED, "bottom-right inside");
        requireTrue(pixelAt(pa, W, 30, 24) == TRANSPARENT, "right edge exclusive");
        requireTrue(pixelAt(pa, W, 9, 10) == TRANSPARENT, "left of box");
        std::printf("  Test 2 (signed rect): PASS\n");
    }

    // ---- Test 3: full arc fills a disc ----
    {
        SdlSurface s(W, H);
        Shape::circle(20, 20, 5, Color(0, 0, 255)).render(s);
        std::vector<uint32_t> px;
        requireTrue(s.readPixels(px), "readable");
        requireTrue(pixelAt(px, W, 20, 20) == BLUE, "center");
        requireTrue(pixelAt(px, W, 16, 20) == BLUE, "inside left");
        requireTrue(pixelAt(px, W, 24, 20) == BLUE, "inside right");
        requireTrue(pixelAt(px, W, 25, 20) == TRANSPARENT, "outside right");
        requireTrue(pixelAt(px, W, 20, 14) == TRANSPARENT, "outside top");
        requireTrue(pixelAt(px, W, 15, 15) == TRANSPARENT, "corner of bounding box");
        std::printf("  Test 3 (disc): PASS\n");
    }

    // ---- Test 4: clearRect returns pixels to transparent ----
    {
        SdlSurface s(W, H);
        s.fillRect(0, 0, W, H, Color(255, 255, 255));
        s.clearRect(0, 0, 8, 8);
        std::vector<uint32_t> px;
        requireTrue(s.readPixels(px), "readable");
        requireTrue(pixelAt(px, W, 3, 3) == TRANSPARENT, "cleared");
        requireTrue(pixelAt(px, W, 8, 8) == WHITE, "outside clear untouched");
        std::printf("  Test 4 (clear): PASS\n");
    }

    // ---- Test 5: controller draws onto real surfaces and saves ----
    {
        SdlSurface main(W, H), preview(W, H);
        CanvasController cc(W, H);
        cc.attachSurfaces(&main, &preview);
        cc.repaint();

        cc.pointerDown(10, 10);
        cc.pointerUp(10, 10);
        cc.selectTool(ToolType::RECT);
        requireTrue(cc.setPrimaryColor("#ff0000"), "red");
        cc.pointerDown(40, 30);
        cc.pointerMove(30, 20);

        std::vector<uint32_t> px;
        requireTrue(preview.readPixels(px), "preview readable");
        requireTrue(pixelAt(px, W, 35, 25) == RED, "preview shows the drag");
        requireTrue(main.readPixels(px), "main readable");
        requireTrue(pixelAt(px, W, 35, 25) == WHITE, "main untouched mid-drag");

        cc.pointerUp(30, 20);
        requireTrue(preview.readPixels(px), "preview readable");
        requireTrue(pixelAt(px, W, 35, 25) == TRANSPARENT, "preview cleared");
        requireTrue(main.readPixels(px), "main readable");
        requireTrue(pixelAt(px, W, 35, 25) == RED, "rect committed");
        requireTrue(pixelAt(px, W, 10, 10) == BLUE, "dab kept");
        requireTrue(pixelAt(px, W, 0, 0) == WHITE, "background white");

        cc.undo();
        requireTrue(main.readPixels(px), "main readable");
        requireTrue(pixelAt(px, W, 35, 25) == WHITE, "undo erased rect");

        MemorySink sink;
        requireTrue(cc.save(sink), "save");
        requireTrue(sink.filename == "canvas.png" && sink.data.size() > 8, "png exported");
        requireTrue(sink.data[1] == 'P' && sink.data[2] == 'N' && sink.data[3] == 'G', "png signature");
        std::printf("  Test 5 (pipeline): PASS\n");
    }

    // ---- Test 6: file sink writes the bytes it is given ----
    {
        FileExportSink sink(".");
        std::vector<uint8_t> bytes = { 0x89, 'P', 'N', 'G', 1, 2, 3 };
        requireTrue(sink.exportImage("dabble_sink_test.bin", bytes), "export");
        requireTrue(sink.lastPath() == "./dabble_sink_test.bin", "path recorded");

        SDL_RWops* rw = SDL_RWFromFile(sink.lastPath().c_str(), "rb");
        requireTrue(rw != nullptr, "file exists");
        std::vector<uint8_t> back(16);
        size_t n = SDL_RWread(rw, back.data(), 1, back.size());
        SDL_RWclose(rw);
        std::remove(sink.lastPath().c_str());
        back.resize(n);
        requireTrue(back == bytes, "contents match");

        requireTrue(!sink.exportImage("empty.bin", std::vector<uint8_t>()), "empty data refused");
        std::printf("  Test 6 (file sink): PASS\n");
    }

    // ---- Test 7: overlay surfaces store translucent colors unblended ----
    {
        const Color halfRed(255, 0, 0, 128 / 255.0f);
        SdlSurface overlay(W, H, false);
        overlay.fillRect(0, 0, 10, 10, halfRed);
        Shape::circle(30, 20, 5, halfRed).render(overlay);
        std::vector<uint32_t> px;
        requireTrue(overlay.readPixels(px), "readable");
        requireTrue(pixelAt(px, W, 5, 5) == 0x80FF0000u, "rect keeps color and alpha");
        requireTrue(pixelAt(px, W, 30, 20) == 0x80FF0000u, "disc keeps color and alpha");

        // Filling twice does not accumulate.
        overlay.fillRect(0, 0, 10, 10, halfRed);
        requireTrue(overlay.readPixels(px), "readable");
        requireTrue(pixelAt(px, W, 5, 5) == 0x80FF0000u, "no double blend");

        SdlSurface canvas(W, H);
        canvas.fillRect(0, 0, W, H, Color(255, 255, 255));
        canvas.fillRect(0, 0, 10, 10, halfRed);
        requireTrue(canvas.readPixels(px), "readable");
        uint32_t blended = pixelAt(px, W, 5, 5);
        requireTrue(((blended >> 16) & 0xFF) == 0xFF, "blended red channel");
        requireTrue(((blended >> 8) & 0xFF) > 0x70 && ((blended >> 8) & 0xFF) < 0x90, "blended over white");
        std::printf("  Test 7 (unblended overlay): PASS\n");
    }

    std::printf("sdl surface: ALL PASS\n");
    return 0;
}
