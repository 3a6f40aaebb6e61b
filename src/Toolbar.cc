#define _USE_MATH_DEFINES
#include "Toolbar.h"
#include "Dabble.h"
#include "Color.h"
#include <cmath>

// ── Layout ───────────────────────────────────────────────────────────────────
//   Row 0:        BRUSH   RECT
//   Rows 1-2:     UNDO    REDO
//                 CLEAR   SAVE
//   Swatch grid:  3 x 6 presets (left click = primary, right click = secondary)
constexpr ToolType toolTypes[] = { ToolType::BRUSH, ToolType::RECT };
constexpr Toolbar::Action actions[] = {
    Toolbar::Action::UNDO, Toolbar::Action::REDO,
    Toolbar::Action::CLEAR, Toolbar::Action::SAVE
};

const char* const Toolbar::PRESETS[NUM_PRESETS] = {
    "#000000", "#404040", "#ffffff",
    "#8b0000", "#f02832", "#ff7864",
    "#e66400", "#ffa53c", "#ffe600",
    "#006400", "#22a022", "#8cdc8c",
    "#0000ff", "#1e64dc", "#8cbeff",
    "#8000c8", "#ff00b4", "#ff00b480",
};

// ─────────────────────────────────────────────────────────────────────────────

Toolbar::Toolbar(SDL_Renderer* renderer, Dabble* app)
    : renderer(renderer), app(app) {}

SDL_Rect Toolbar::toolButtonRect(int idx) const {
    int cellW = (TB_W - TB_PAD) / 2;
    return { TB_PAD/2 + idx*cellW, toolStartY(), cellW-2, ICON_SIZE };
}

SDL_Rect Toolbar::actionButtonRect(int idx) const {
    int cellW = (TB_W - TB_PAD) / 2;
    int row = idx / 2, col = idx % 2;
    return { TB_PAD/2 + col*cellW, actionStartY() + row*(ICON_SIZE+ICON_GAP), cellW-2, ICON_SIZE };
}

int Toolbar::hitPresetSwatch(int x, int y) const {
    int sz = swatchCellSize(), stride = swatchCellStride();
    int lx = x - TB_PAD, ly = y - presetGridY();
    if (lx < 0 || ly < 0) return -1;
    int col = lx / stride, row = ly / stride;
    if (col >= 3 || row >= NUM_PRESETS / 3) return -1;
    if (lx % stride >= sz || ly % stride >= sz) return -1;
    return row * 3 + col;
}

// ── Icon drawing ──────────────────────────────────────────────────────────────

void Toolbar::drawToolIcon(const SDL_Rect& btn, ToolType t, bool active) {
    SDL_Color fg = active ? SDL_Color{255,255,255,255} : SDL_Color{160,160,170,255};
    SDL_SetRenderDrawColor(renderer, fg.r, fg.g, fg.b, 255);
    int cx = btn.x + btn.w/2, cy = btn.y + btn.h/2;
    switch (t) {
        case ToolType::BRUSH: {
            // Solid circle with radius 4 (8x8 footprint)
            const int r = 4;
            for (int dy = -r; dy <= r; dy++) {
                int dx = (int)std::sqrt((float)(r * r - dy * dy) + 0.5f);
                SDL_RenderDrawLine(renderer, cx - dx, cy + dy, cx + dx, cy + dy);
            }
            break;
        }
        case ToolType::RECT: {
            SDL_Rect box = { cx - 7, cy - 5, 15, 11 };
            SDL_RenderFillRect(renderer, &box);
            break;
        }
    }
}

void Toolbar::drawActionIcon(const SDL_Rect& btn, Action a) {
    SDL_SetRenderDrawColor(renderer, 200, 200, 210, 255);
    int cx = btn.x + btn.w/2, cy = btn.y + btn.h/2;
    switch (a) {
        case Action::UNDO:
        case Action::REDO: {
            // Arrow pointing left for undo, right for redo
            int dir = (a == Action::UNDO) ? -1 : 1;
            SDL_RenderDrawLine(renderer, cx - 6, cy, cx + 6, cy);
            SDL_RenderDrawLine(renderer, cx + dir*6, cy, cx + dir*2, cy - 4);
            SDL_RenderDrawLine(renderer, cx + dir*6, cy, cx + dir*2, cy + 4);
            break;
        }
        case Action::CLEAR:
            SDL_RenderDrawLine(renderer, cx - 5, cy - 5, cx + 5, cy + 5);
            SDL_RenderDrawLine(renderer, cx - 5, cy + 5, cx + 5, cy - 5);
            break;
        case Action::SAVE: {
            // Floppy: outline with a filled label strip
            SDL_Rect body  = { cx - 6, cy - 6, 13, 13 };
            SDL_Rect label = { cx - 3, cy + 1, 7, 5 };
            SDL_RenderDrawRect(renderer, &body);
            SDL_RenderFillRect(renderer, &label);
            break;
        }
        case Action::NONE:
            break;
    }
}

// ── Full draw ─────────────────────────────────────────────────────────────────

void Toolbar::draw() {
    int winW, winH;
    SDL_GetWindowSize(SDL_RenderGetWindow(renderer), &winW, &winH);

    // Background panel + right border
    SDL_Rect panel = {0, 0, TB_W, winH};
    SDL_SetRenderDrawColor(renderer, 30, 30, 35, 255);
    SDL_RenderFillRect(renderer, &panel);
    SDL_SetRenderDrawColor(renderer, 60, 60, 68, 255);
    SDL_RenderDrawLine(renderer, TB_W-1, 0, TB_W-1, winH);

    for (int i = 0; i < 2; i++) {
        SDL_Rect btn = toolButtonRect(i);
        bool active = currentType == toolTypes[i];
        SDL_SetRenderDrawColor(renderer, active ? 70 : 45, active ? 110 : 45, active ? 190 : 52, 255);
        SDL_RenderFillRect(renderer, &btn);
        drawToolIcon(btn, toolTypes[i], active);
    }

    for (int i = 0; i < 4; i++) {
        SDL_Rect btn = actionButtonRect(i);
        SDL_SetRenderDrawColor(renderer, 45, 45, 52, 255);
        SDL_RenderFillRect(renderer, &btn);
        drawActionIcon(btn, actions[i]);
    }

    int sz = swatchCellSize(), stride = swatchCellStride();
    for (int i = 0; i < NUM_PRESETS; i++) {
        Color c;
        if (Color::parseHex(PRESETS[i], c) != ColorParseError::OK) continue;
        SDL_Color sc = c.toSDLColor();
        SDL_Rect cell = { TB_PAD + (i % 3) * stride, presetGridY() + (i / 3) * stride, sz, sz };
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
        SDL_SetRenderDrawColor(renderer, sc.r, sc.g, sc.b, sc.a);
        SDL_RenderFillRect(renderer, &cell);
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
        if (i == primarySlot || i == secondarySlot) {
            // White ring for primary, grey for secondary
            Uint8 ring = (i == primarySlot) ? 255 : 140;
            SDL_SetRenderDrawColor(renderer, ring, ring, ring, 255);
            SDL_Rect outline = { cell.x - 1, cell.y - 1, cell.w + 2, cell.h + 2 };
            SDL_RenderDrawRect(renderer, &outline);
        }
    }
}

// ── Events ────────────────────────────────────────────────────────────────────

bool Toolbar::onMouseDown(int x, int y, Uint8 button) {
    if (!inToolbar(x, y)) return false;
    SDL_Point pt = {x, y};

    for (int i = 0; i < 2; i++) {
        SDL_Rect btn = toolButtonRect(i);
        if (SDL_PointInRect(&pt, &btn)) {
            app->setTool(toolTypes[i]);
            currentType = toolTypes[i];
            return true;
        }
    }

    for (int i = 0; i < 4; i++) {
        SDL_Rect btn = actionButtonRect(i);
        if (SDL_PointInRect(&pt, &btn)) {
            app->runAction(actions[i]);
            return true;
        }
    }

    int slot = hitPresetSwatch(x, y);
    if (slot >= 0) {
        bool primary = button != SDL_BUTTON_RIGHT;
        if (app->setColor(PRESETS[slot], primary)) {
            if (primary) primarySlot = slot;
            else         secondarySlot = slot;
        }
    }
    return true;  // clicks on empty toolbar space are swallowed too
}
