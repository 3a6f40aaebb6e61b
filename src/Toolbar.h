#pragma once
#include <SDL2/SDL.h>
#include "Tools.h"

// Toolbar calls back into Dabble for every action
class Dabble;

class Toolbar {
  public:
    static constexpr int TB_W      = 84;
    static constexpr int TB_PAD    = 6;
    static constexpr int ICON_SIZE = 24;
    static constexpr int ICON_GAP  = 3;

    static constexpr int NUM_PRESETS = 18;
    static const char* const PRESETS[NUM_PRESETS];

    enum class Action { NONE, UNDO, REDO, CLEAR, SAVE };

    ToolType currentType = ToolType::BRUSH;
    int      primarySlot   = -1;
    int      secondarySlot = -1;

    Toolbar(SDL_Renderer* renderer, Dabble* app);

    void draw();

    // Return true if the click was consumed by the toolbar
    bool onMouseDown(int x, int y, Uint8 button);
    bool inToolbar(int x, int y) const { return x < TB_W; }

  private:
    SDL_Renderer* renderer;
    Dabble*       app;

    // Layout helpers
    int toolStartY()   const { return TB_PAD; }
    int actionStartY() const { return toolStartY() + ICON_SIZE + ICON_GAP * 3; }
    int presetGridY()  const { return actionStartY() + 2 * (ICON_SIZE + ICON_GAP) + ICON_GAP * 2; }
    int swatchCellSize()   const { return (TB_W - TB_PAD*2 - 4) / 3; }
    int swatchCellStride() const { return swatchCellSize() + 2; }

    SDL_Rect toolButtonRect  (int idx) const;
    SDL_Rect actionButtonRect(int idx) const;
    int      hitPresetSwatch (int x, int y) const;

    void drawToolIcon  (const SDL_Rect& btn, ToolType t, bool active);
    void drawActionIcon(const SDL_Rect& btn, Action a);
};
