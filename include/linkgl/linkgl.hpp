#pragma once

// linkgl - Main include file
// Include this header to access the resource graph and renderer

// Core foundation
#include "linkgl/core/logging.hpp"
#include "linkgl/core/types.hpp"
#include "linkgl/core/id.hpp"
#include "linkgl/core/errors.hpp"

// Graphics API and host seams
#include "linkgl/gfx/graphics_context.hpp"
#include "linkgl/gfx/frame_scheduler.hpp"

// Resource graph
#include "linkgl/graph/links.hpp"
#include "linkgl/graph/link_context.hpp"
#include "linkgl/graph/link_registry.hpp"
#include "linkgl/graph/dependency_graph.hpp"

// Renderer
#include "linkgl/engine/frame_clock.hpp"
#include "linkgl/engine/animation_driver.hpp"
#include "linkgl/engine/renderer_data.hpp"
#include "linkgl/engine/renderer.hpp"
