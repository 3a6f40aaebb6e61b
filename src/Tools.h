#pragma once

#include <functional>
#include "Color.h"
#include "Shape.h"

enum class ToolType { BRUSH, RECT };

const char* toolName(ToolType t);

// Gesture handler for the active tool. A closed set of variants selected by
// ToolType; per-variant state lives side by side and is dispatched in Tool.cc.
//
// Results leave through two callbacks: commit() for shapes that become part of
// the drawing, preview() for the transient candidate (nullptr = clear preview).
class Tool {
  public:
    using CommitCallback  = std::function<void(const Shape&)>;
    using PreviewCallback = std::function<void(const Shape*)>;

    Tool(ToolType t, Color primary, Color secondary,
         CommitCallback onCommit, PreviewCallback onPreview);

    ToolType type() const { return kind; }

    void onGestureStart(double x, double y);
    void onGestureMove (double x, double y);
    void onGestureEnd  (double x, double y);

    // Drop any in-progress gesture without committing.
    void cancel();

    void  setPrimaryColor  (Color c) { primary = c; }
    void  setSecondaryColor(Color c) { secondary = c; }
    Color primaryColor()   const { return primary; }
    Color secondaryColor() const { return secondary; }

    bool hasAnchor() const { return rect.anchored; }

  private:
    ToolType        kind;
    Color           primary;
    Color           secondary;  // no current variant paints with it
    CommitCallback  commit;
    PreviewCallback preview;

    struct BrushState {
        double radius;
    } brush;

    struct RectState {
        bool   anchored = false;
        double anchorX  = 0.0, anchorY = 0.0;
    } rect;

    // tools/BrushTool.cc
    void brushDab(double x, double y);

    // tools/RectTool.cc
    void rectStart (double x, double y);
    void rectMove  (double x, double y);
    void rectEnd   (double x, double y);
    void rectCancel();
};
