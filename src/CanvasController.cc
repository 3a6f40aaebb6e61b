#include "CanvasController.h"
#include "DrawingUtils.h"
#include <SDL2/SDL.h>
#include <vector>

static const Color WHITE(255, 255, 255);

CanvasController::CanvasController(int width, int height)
    : canvasW(width), canvasH(height),
      primary(DEFAULT_PRIMARY), secondary(DEFAULT_SECONDARY),
      tool(makeTool(ToolType::BRUSH)) {}

Tool CanvasController::makeTool(ToolType t) {
    return Tool(t, primary, secondary,
                [this](const Shape& s) { onCommit(s); },
                [this](const Shape* s) { onPreview(s); });
}

void CanvasController::attachSurfaces(RenderTarget* main, RenderTarget* preview) {
    mainSurface    = main;
    previewSurface = preview;
}

// ── Tool callbacks ────────────────────────────────────────────────────────────

void CanvasController::onCommit(const Shape& s) {
    shapes.push(s);
}

void CanvasController::onPreview(const Shape* s) {
    if (!previewSurface) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Preview surface not attached; skipping preview");
        return;
    }
    previewSurface->clearRect(0, 0, canvasW, canvasH);
    if (s) s->render(*previewSurface);
}

// ── Repaint ───────────────────────────────────────────────────────────────────

void CanvasController::repaint() {
    if (!mainSurface) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Canvas surface not attached; skipping repaint");
        return;
    }
    mainSurface->clearRect(0, 0, canvasW, canvasH);
    mainSurface->fillRect(0, 0, canvasW, canvasH, WHITE);
    for (const Shape& s : shapes.committed())
        s.render(*mainSurface);
}

// ── Input events ──────────────────────────────────────────────────────────────

void CanvasController::pointerDown(double x, double y) {
    pointerPressed = true;
    tool.onGestureStart(x, y);
    repaint();
}

void CanvasController::pointerMove(double x, double y) {
    if (!pointerPressed) return;
    tool.onGestureMove(x, y);
    repaint();
}

void CanvasController::pointerUp(double x, double y) {
    if (!pointerPressed) return;
    pointerPressed = false;
    tool.onGestureEnd(x, y);
    repaint();
}

void CanvasController::selectTool(ToolType t) {
    tool.cancel();
    pointerPressed = false;
    tool = makeTool(t);
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Tool: %s", toolName(t));
    repaint();
}

bool CanvasController::undo() {
    bool changed = shapes.undo();
    repaint();
    return changed;
}

bool CanvasController::redo() {
    bool changed = shapes.redo();
    repaint();
    return changed;
}

void CanvasController::clear() {
    shapes.clear();
    repaint();
}

bool CanvasController::setPrimaryColor(const std::string& hex) {
    Color c;
    ColorParseError err = Color::parseHex(hex, c);
    if (err != ColorParseError::OK) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Ignoring primary color \"%s\": %s",
                    hex.c_str(), parseErrorString(err));
        return false;
    }
    primary = c;
    tool.setPrimaryColor(c);
    repaint();
    return true;
}

bool CanvasController::setSecondaryColor(const std::string& hex) {
    Color c;
    ColorParseError err = Color::parseHex(hex, c);
    if (err != ColorParseError::OK) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Ignoring secondary color \"%s\": %s",
                    hex.c_str(), parseErrorString(err));
        return false;
    }
    secondary = c;
    tool.setSecondaryColor(c);
    repaint();
    return true;
}

// ── Export ────────────────────────────────────────────────────────────────────

bool CanvasController::save(ExportSink& sink) const {
    if (!mainSurface) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Canvas surface not attached; nothing to save");
        return false;
    }
    std::vector<uint32_t> pixels;
    if (!mainSurface->readPixels(pixels)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Canvas surface cannot be read; nothing to save");
        return false;
    }
    if (pixels.size() < (size_t)mainSurface->width() * mainSurface->height()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Canvas surface returned a short read; nothing to save");
        return false;
    }
    std::vector<uint8_t> png = DrawingUtils::encodePNG(pixels.data(), mainSurface->width(), mainSurface->height());
    if (png.empty()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PNG encoding failed");
        return false;
    }
    return sink.exportImage(EXPORT_FILENAME, png);
}
