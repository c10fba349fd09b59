#pragma once

// Single place the SDL front-end includes SDL from.
// main() stays our own entry point (no SDLmain); main.cpp calls SDL_SetMainReady()
// before SDL_Init().
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
