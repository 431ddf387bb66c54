#pragma once

#include <cstdint>
#include <format>
#include <vector>

namespace Kcursor {
    struct SImage {
        // nominal size: the requested size for svg frames, the embedded one for xcursor frames
        uint32_t             size   = 0;
        uint32_t             width  = 0;
        uint32_t             height = 0;

        // hotspot in output pixels
        uint32_t             xhot = 0;
        uint32_t             yhot = 0;

        // ms to the next frame, 0 when the source declares none
        uint32_t             delay = 0;

        // RGBA, premultiplied alpha, row-major, width * height * 4 bytes
        std::vector<uint8_t> pixels;
    };
}

template <typename CharT>
struct std::formatter<Kcursor::SImage, CharT> : std::formatter<CharT> {
    template <typename FormatContext>
    auto format(const Kcursor::SImage& img, FormatContext& ctx) const {
        return std::format_to(ctx.out(), "[SImage size: {}, {}x{}, hotspot: {}x{}, delay: {}ms, pixels: {} bytes]", img.size, img.width, img.height, img.xhot, img.yhot,
                              img.delay, img.pixels.size());
    }
};
