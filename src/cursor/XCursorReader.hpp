#pragma once

#include <cstdint>
#include <string>

#include "CursorIcon.hpp"

namespace Kcursor::XCursorReader {
    /*
        Loads every image embedded in the xcursor file at path and returns the
        frames of the embedded size closest to the requested one, in file order.
        On a tie the size that comes first in the file wins.
    */
    FramesResult load(const std::string& path, uint32_t size);
}
