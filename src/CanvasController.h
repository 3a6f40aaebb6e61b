#pragma once

#include <string>
#include "Color.h"
#include "Constants.h"
#include "ExportSink.h"
#include "History.h"
#include "RenderTarget.h"
#include "Tools.h"

// Owns the drawing state and turns input events into history changes and
// repaints. The main surface is fully repainted after every event; the
// preview surface only changes through the active tool.
//
// Surfaces are not owned. Until attachSurfaces() is called, events still
// update state but repaints are skipped.
class CanvasController {
  public:
    CanvasController(int width = CANVAS_WIDTH, int height = CANVAS_HEIGHT);
    CanvasController(const CanvasController&) = delete;
    CanvasController& operator=(const CanvasController&) = delete;

    void attachSurfaces(RenderTarget* main, RenderTarget* preview);
    void detachSurfaces() { attachSurfaces(nullptr, nullptr); }

    // ── Input events ──────────────────────────────────────────────────────────
    void pointerDown(double x, double y);
    void pointerMove(double x, double y);  // ignored unless pressed
    void pointerUp  (double x, double y);  // ignored unless pressed

    // Replaces the active tool. An unfinished gesture is dropped.
    void selectTool(ToolType t);

    bool undo();
    bool redo();
    void clear();

    // Hex strings as accepted by Color::parseHex. On a parse failure the
    // previous color stays and false is returned.
    bool setPrimaryColor  (const std::string& hex);
    bool setSecondaryColor(const std::string& hex);

    // Encode the main surface as PNG and hand it to the sink as EXPORT_FILENAME.
    bool save(ExportSink& sink) const;

    // Full repaint of the main surface from the committed shapes.
    void repaint();

    // ── State ─────────────────────────────────────────────────────────────────
    int            width()          const { return canvasW; }
    int            height()         const { return canvasH; }
    // True if (x, y) lies on the canvas. Gestures may only start there.
    bool           contains(double x, double y) const {
        return x >= 0 && y >= 0 && x < canvasW && y < canvasH;
    }
    const History& history()        const { return shapes; }
    ToolType       activeTool()     const { return tool.type(); }
    bool           isPointerDown()  const { return pointerPressed; }
    bool           isGestureActive() const { return pointerPressed || tool.hasAnchor(); }
    Color          primaryColor()   const { return primary; }
    Color          secondaryColor() const { return secondary; }

  private:
    int canvasW, canvasH;

    History shapes;
    Color   primary;
    Color   secondary;
    Tool    tool;
    bool    pointerPressed = false;

    RenderTarget* mainSurface    = nullptr;
    RenderTarget* previewSurface = nullptr;

    Tool makeTool(ToolType t);
    void onCommit (const Shape& s);
    void onPreview(const Shape* s);
};
