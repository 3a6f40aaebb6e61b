#pragma once
#include <SDL2/SDL.h>
#include <memory>
#include <string>
#include "CanvasController.h"
#include "ExportSink.h"
#include "SdlSurface.h"
#include "Toolbar.h"

// Application shell: owns the window, both canvas surfaces and the toolbar,
// and feeds SDL events into the CanvasController.
class Dabble {
  public:
    Dabble();
    ~Dabble();

    bool isValid() const { return window && renderer && canvas && overlay &&
                                   mainSurface->isValid() && previewSurface->isValid(); }
    void run();

    // Called by Toolbar
    void setTool(ToolType t);
    void runAction(Toolbar::Action a);
    bool setColor(const std::string& hex, bool primary);

  private:
    static const int GAP = 30;  // space around the canvas inside the window

    SDL_Window*   window   = nullptr;
    SDL_Renderer* renderer = nullptr;
    SDL_Texture*  canvas   = nullptr;
    SDL_Texture*  overlay  = nullptr;

    std::unique_ptr<SdlSurface> mainSurface;
    std::unique_ptr<SdlSurface> previewSurface;
    CanvasController            controller;
    Toolbar                     toolbar;
    FileExportSink              exportSink;

    SDL_Rect getViewport() const;
    void     getCanvasCoords(int winX, int winY, double* cX, double* cY) const;
    void     uploadSurface(SDL_Texture* tex, SdlSurface& surface);
    void     save();
};
