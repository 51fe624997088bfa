#pragma once

/**
 * @file linkgl_window.hpp
 * @brief Main header for the linkgl-window library
 *
 * Desktop backend: a GLFW window with an OpenGL ES 3.0 context as the
 * Canvas, and a display-refresh loop as the FrameScheduler.
 */

#include "linkgl/linkgl.hpp"
#include "linkgl/window/window.hpp"
#include "linkgl/window/gles_context.hpp"
#include "linkgl/window/frame_loop.hpp"
