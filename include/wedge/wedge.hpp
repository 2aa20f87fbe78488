#pragma once

#include <wedge/chart_surface.hpp>
#include <wedge/color.hpp>
#include <wedge/display_list.hpp>
#include <wedge/draw_context.hpp>
#include <wedge/export.hpp>
#include <wedge/logger.hpp>
#include <wedge/radial_layout.hpp>
#include <wedge/value_set.hpp>
