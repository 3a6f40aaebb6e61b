#include "Dabble.h"
#include "Constants.h"

// ─────────────────────────────────────────────────────────────────────────────

Dabble::Dabble()
    : mainSurface(std::make_unique<SdlSurface>(CANVAS_WIDTH, CANVAS_HEIGHT)),
      previewSurface(std::make_unique<SdlSurface>(CANVAS_WIDTH, CANVAS_HEIGHT, false)),
      controller(CANVAS_WIDTH, CANVAS_HEIGHT),
      toolbar(nullptr, this) {
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_Init failed: %s", SDL_GetError());
        return;
    }
    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0");

    window = SDL_CreateWindow("Dabble", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              WINDOW_WIDTH, WINDOW_HEIGHT, SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateWindow failed: %s", SDL_GetError());
        return;
    }
    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateRenderer failed: %s", SDL_GetError());
        return;
    }

    toolbar = Toolbar(renderer, this);

    canvas  = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_ARGB8888,
                                SDL_TEXTUREACCESS_STREAMING, CANVAS_WIDTH, CANVAS_HEIGHT);
    overlay = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_ARGB8888,
                                SDL_TEXTUREACCESS_STREAMING, CANVAS_WIDTH, CANVAS_HEIGHT);
    if (!canvas || !overlay) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateTexture failed: %s", SDL_GetError());
        return;
    }
    SDL_SetTextureBlendMode(overlay, SDL_BLENDMODE_BLEND);

    controller.attachSurfaces(mainSurface.get(), previewSurface.get());
    controller.repaint();
}

Dabble::~Dabble() {
    controller.detachSurfaces();
    if (canvas)   SDL_DestroyTexture(canvas);
    if (overlay)  SDL_DestroyTexture(overlay);
    if (renderer) SDL_DestroyRenderer(renderer);
    if (window)   SDL_DestroyWindow(window);
    SDL_Quit();
}

// ── Viewport ──────────────────────────────────────────────────────────────────

// Canvas drawn 1:1 to the right of the toolbar.
SDL_Rect Dabble::getViewport() const {
    return { Toolbar::TB_W + GAP, GAP, CANVAS_WIDTH, CANVAS_HEIGHT };
}

void Dabble::getCanvasCoords(int winX, int winY, double* cX, double* cY) const {
    SDL_Rect v = getViewport();
    *cX = winX - v.x;
    *cY = winY - v.y;
}

// ── Toolbar callbacks ─────────────────────────────────────────────────────────

void Dabble::setTool(ToolType t) {
    controller.selectTool(t);
    toolbar.currentType = t;
}

void Dabble::runAction(Toolbar::Action a) {
    switch (a) {
        case Toolbar::Action::UNDO:  controller.undo();  break;
        case Toolbar::Action::REDO:  controller.redo();  break;
        case Toolbar::Action::CLEAR: controller.clear(); break;
        case Toolbar::Action::SAVE:  save();             break;
        case Toolbar::Action::NONE:  break;
    }
}

bool Dabble::setColor(const std::string& hex, bool primary) {
    return primary ? controller.setPrimaryColor(hex) : controller.setSecondaryColor(hex);
}

void Dabble::save() {
    if (!controller.save(exportSink))
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Save failed");
}

// ── Compositing ───────────────────────────────────────────────────────────────

void Dabble::uploadSurface(SDL_Texture* tex, SdlSurface& surface) {
    SDL_Surface* s = surface.getSurface();
    if (!s) return;
    if (SDL_MUSTLOCK(s) && SDL_LockSurface(s) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_LockSurface failed: %s", SDL_GetError());
        return;
    }
    if (SDL_UpdateTexture(tex, nullptr, s->pixels, s->pitch) != 0)
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_UpdateTexture failed: %s", SDL_GetError());
    if (SDL_MUSTLOCK(s)) SDL_UnlockSurface(s);
}

// ── Run loop ──────────────────────────────────────────────────────────────────

void Dabble::run() {
    if (!isValid()) return;
    bool running     = true;
    bool needsRedraw = true;
    SDL_Event e;

    while (running) {
        while (SDL_PollEvent(&e)) {
            if (e.type == SDL_QUIT) { running = false; break; }

            if (e.type == SDL_KEYDOWN) {
                bool cmd   = (e.key.keysym.mod & (KMOD_GUI | KMOD_CTRL)) != 0;
                bool shift = (e.key.keysym.mod & KMOD_SHIFT) != 0;
                switch (e.key.keysym.sym) {
                    case SDLK_b: if (!cmd) setTool(ToolType::BRUSH); break;
                    case SDLK_r: if (!cmd) setTool(ToolType::RECT);  break;
                    case SDLK_BACKSPACE:
                    case SDLK_DELETE:
                        controller.clear();
                        break;
                    case SDLK_z:
                        if (cmd) { if (shift) controller.redo(); else controller.undo(); }
                        break;
                    case SDLK_y:
                        if (cmd) controller.redo();
                        break;
                    case SDLK_s:
                        if (cmd) save();
                        break;
                }
                needsRedraw = true;
            }

            if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_RESIZED)
                needsRedraw = true;

            double cX, cY;
            if (e.type == SDL_MOUSEBUTTONDOWN) {
                if (toolbar.onMouseDown(e.button.x, e.button.y, e.button.button)) {
                    needsRedraw = true; continue;
                }
                if (e.button.button != SDL_BUTTON_LEFT) continue;
                getCanvasCoords(e.button.x, e.button.y, &cX, &cY);
                if (!controller.contains(cX, cY)) continue;  // margin around the canvas
                controller.pointerDown(cX, cY);
                needsRedraw = true;
            }

            if (e.type == SDL_MOUSEBUTTONUP && e.button.button == SDL_BUTTON_LEFT) {
                getCanvasCoords(e.button.x, e.button.y, &cX, &cY);
                controller.pointerUp(cX, cY);
                needsRedraw = true;
            }

            if (e.type == SDL_MOUSEMOTION && controller.isPointerDown()) {
                getCanvasCoords(e.motion.x, e.motion.y, &cX, &cY);
                controller.pointerMove(cX, cY);
                needsRedraw = true;
            }
        }

        if (!needsRedraw) { SDL_Delay(4); continue; }
        needsRedraw = false;

        // 1. Upload both canvas layers
        uploadSurface(canvas,  *mainSurface);
        uploadSurface(overlay, *previewSurface);

        // 2. Composite
        SDL_SetRenderDrawColor(renderer, 40, 40, 40, 255);
        SDL_RenderClear(renderer);
        SDL_Rect v = getViewport();
        SDL_RenderCopy(renderer, canvas,  nullptr, &v);
        SDL_RenderCopy(renderer, overlay, nullptr, &v);

        // 3. Toolbar
        toolbar.draw();

        SDL_RenderPresent(renderer);
    }
}
