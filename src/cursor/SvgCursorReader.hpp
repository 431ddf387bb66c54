#pragma once

#include <cstdint>
#include <expected>
#include <string>

#include "CursorIcon.hpp"
#include "FrameMeta.hpp"

namespace Kcursor::SvgCursorReader {
    /*
        Renders every frame listed in the icon directory's metadata.json at the
        requested size. Any frame failing to render fails the whole call.
    */
    FramesResult                         load(const std::string& iconDir, uint32_t size);

    std::expected<SImage, SFramesError> renderFrame(const std::string& iconDir, const SFrameMeta& meta, uint32_t size);
}
