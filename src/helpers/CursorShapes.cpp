#include "CursorShapes.hpp"

#include <algorithm>
#include <array>
#include <utility>

using namespace Kcursor;

// clang-format off
static constexpr std::array<std::pair<std::string_view, std::string_view>, 34> LEGACY_SHAPE_NAMES = {{
    {"default",       "left_ptr"},
    {"context-menu",  "left_ptr"},
    {"help",          "left_ptr"},
    {"pointer",       "hand2"},
    {"progress",      "watch"},
    {"wait",          "watch"},
    {"cell",          "plus"},
    {"crosshair",     "cross"},
    {"text",          "xterm"},
    {"vertical-text", "xterm"},
    {"alias",         "dnd-link"},
    {"copy",          "dnd-copy"},
    {"move",          "dnd-move"},
    {"no-drop",       "dnd-none"},
    {"not-allowed",   "crossed_circle"},
    {"grab",          "hand1"},
    {"grabbing",      "hand1"},
    {"e-resize",      "right_side"},
    {"n-resize",      "top_side"},
    {"ne-resize",     "top_right_corner"},
    {"nw-resize",     "top_left_corner"},
    {"s-resize",      "bottom_side"},
    {"se-resize",     "bottom_right_corner"},
    {"sw-resize",     "bottom_left_corner"},
    {"w-resize",      "left_side"},
    {"ew-resize",     "sb_h_double_arrow"},
    {"ns-resize",     "sb_v_double_arrow"},
    {"nesw-resize",   "fd_double_arrow"},
    {"nwse-resize",   "bd_double_arrow"},
    {"col-resize",    "sb_h_double_arrow"},
    {"row-resize",    "sb_v_double_arrow"},
    {"all-scroll",    "fleur"},
    {"zoom-in",       "left_ptr"},
    {"zoom-out",      "left_ptr"},
}};
// clang-format on

std::string Kcursor::legacyShapeName(std::string_view shape) {
    const auto IT = std::ranges::find_if(LEGACY_SHAPE_NAMES, [shape](const auto& e) { return e.first == shape; });

    if (IT == LEGACY_SHAPE_NAMES.end())
        return std::string();

    return std::string{IT->second};
}
