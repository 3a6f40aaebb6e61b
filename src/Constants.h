#pragma once

#include "Color.h"

// Canvas dimensions in pixels, fixed for the session.
const int CANVAS_WIDTH  = 500;
const int CANVAS_HEIGHT = 500;

// Radius of a single brush dab in canvas pixels.
const double BRUSH_RADIUS = 5.0;

const char* const EXPORT_FILENAME = "canvas.png";

const Color DEFAULT_PRIMARY  (0, 0, 255);
const Color DEFAULT_SECONDARY(255, 255, 255);

const int WINDOW_WIDTH  = 700;
const int WINDOW_HEIGHT = 600;
