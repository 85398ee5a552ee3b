#pragma once

// Centralized SDL include for diagnostics.
// We define SDL_MAIN_HANDLED to prevent SDL from redefining main() as SDL_main.
// This avoids needing to link against SDLmain and keeps the entrypoint explicit.
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>

#include "settings.hpp"

// Diagnostics go through SDL's log API (stderr on desktop platforms), keeping
// stdout free for the game itself.
enum LogCategory : int {
    LOG_APP = SDL_LOG_CATEGORY_CUSTOM,
    LOG_GEN,
};

// Maps the settings level onto SDL priorities for our categories.
void applyLogLevel(LogLevel level);
