#pragma once

#include <string>
#include <string_view>

namespace Kcursor {
    /*
        Maps a shape name to the X11 cursorfont name older themes ship it under.
        Returns an empty string for names without a legacy counterpart.
    */
    std::string legacyShapeName(std::string_view shape);
}
