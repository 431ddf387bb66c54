#include "XCursorReader.hpp"
#include "../debug/log/Logger.hpp"
#include "../helpers/memory/Memory.hpp"

#include <X11/Xcursor/Xcursor.h>

#include <algorithm>
#include <cstdio>
#include <memory>
#include <span>

using namespace Kcursor;

static uint32_t sizeDistance(uint32_t a, uint32_t b) {
    return a > b ? a - b : b - a;
}

// xcursor pixels are premultiplied ARGB words in host byte order
static SImage imageFromXcursor(const XcursorImage* xImage) {
    SImage image;
    image.size   = xImage->size;
    image.width  = xImage->width;
    image.height = xImage->height;
    image.xhot   = xImage->xhot;
    image.yhot   = xImage->yhot;
    image.delay  = xImage->delay;

    const auto PIXELS = std::span<const XcursorPixel>{xImage->pixels, sc<size_t>(xImage->width) * xImage->height};

    image.pixels.reserve(PIXELS.size() * 4);
    for (const auto px : PIXELS) {
        image.pixels.push_back((px >> 16) & 0xFF);
        image.pixels.push_back((px >> 8) & 0xFF);
        image.pixels.push_back(px & 0xFF);
        image.pixels.push_back((px >> 24) & 0xFF);
    }

    return image;
}

FramesResult XCursorReader::load(const std::string& path, uint32_t size) {
    using PcloseType = int (*)(FILE*);
    const std::unique_ptr<FILE, PcloseType> f(fopen(path.c_str(), "rb"), static_cast<PcloseType>(fclose));

    if (!f) {
        Log::logger->log(Log::WARN, "XCursor: can't open {}", path);
        return std::unexpected(SFramesError{FRAMES_ERROR_NOT_FOUND, std::format("can't open {}", path)});
    }

    const std::unique_ptr<XcursorImages, decltype(&XcursorImagesDestroy)> xImages(XcursorFileLoadAllImages(f.get()), &XcursorImagesDestroy);

    if (!xImages || xImages->nimage <= 0) {
        Log::logger->log(Log::DEBUG, "XCursor: {} has no images", path);
        return std::unexpected(SFramesError{FRAMES_ERROR_NOT_FOUND, std::format("{} is not an xcursor file or has no images", path)});
    }

    const auto IMAGES = std::span<XcursorImage*>{xImages->images, sc<size_t>(xImages->nimage)};

    // min_element keeps the first of equal candidates, which is the file order
    const auto NEAREST = (*std::ranges::min_element(IMAGES, {}, [size](const XcursorImage* img) { return sizeDistance(img->size, size); }))->size;

    std::vector<SImage> frames;
    for (const auto* xImage : IMAGES) {
        if (xImage->size != NEAREST)
            continue;

        frames.emplace_back(imageFromXcursor(xImage));
    }

    Log::logger->log(Log::TRACE, "XCursor: {} requested size {}, using embedded size {} ({} frames)", path, size, NEAREST, frames.size());

    return frames;
}
