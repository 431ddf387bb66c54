#include "SvgCursorReader.hpp"
#include "../debug/log/Logger.hpp"
#include "../helpers/memory/Memory.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <optional>
#include <utility>

#include <cairo/cairo.h>
#include <librsvg/rsvg.h>

#include <hyprutils/os/File.hpp>
#include <hyprutils/utils/ScopeGuard.hpp>

using namespace Kcursor;
using namespace Hyprutils::Utils;

static std::unexpected<SFramesError> malformed(std::string message) {
    return std::unexpected(SFramesError{FRAMES_ERROR_MALFORMED, std::move(message)});
}

// cairo rejects image surfaces larger than this on either side
constexpr double MAX_DIMENSION = 32767;

// a scaled length truncated to whole pixels, nullopt when it doesn't fit a surface
static std::optional<uint32_t> toPixels(double value) {
    if (!std::isfinite(value) || value > MAX_DIMENSION)
        return std::nullopt;

    return sc<uint32_t>(std::max(0.0, value));
}

// width / height of the document in px, falling back to the viewBox
static std::optional<std::pair<double, double>> intrinsicSize(RsvgHandle* handle) {
    gdouble w = 0, h = 0;
    if (rsvg_handle_get_intrinsic_size_in_pixels(handle, &w, &h))
        return std::make_pair(w, h);

    gboolean      hasWidth = false, hasHeight = false, hasViewBox = false;
    RsvgLength    width, height;
    RsvgRectangle viewBox;
    rsvg_handle_get_intrinsic_dimensions(handle, &hasWidth, &width, &hasHeight, &height, &hasViewBox, &viewBox);

    if (hasViewBox)
        return std::make_pair(viewBox.width, viewBox.height);

    return std::nullopt;
}

std::expected<SImage, SFramesError> SvgCursorReader::renderFrame(const std::string& iconDir, const SFrameMeta& meta, uint32_t size) {
    const auto PATH = (std::filesystem::path{iconDir} / meta.filename).string();
    const auto DATA = Hyprutils::File::readFileAsString(PATH);

    if (!DATA)
        return malformed(std::format("can't read frame {}: {}", PATH, DATA.error()));

    GError* error  = nullptr;
    auto*   handle = rsvg_handle_new_from_data(rc<const guint8*>(DATA->data()), DATA->size(), &error);

    if (!handle) {
        std::string msg = error ? error->message : "unknown error";
        if (error)
            g_error_free(error);
        return malformed(std::format("can't parse {}: {}", PATH, msg));
    }

    CScopeGuard handleGuard([handle] { g_object_unref(handle); });

    const auto SVGSIZE = intrinsicSize(handle);
    if (!SVGSIZE)
        return malformed(std::format("{} has no intrinsic size", PATH));

    const double SCALE   = sc<double>(size) / meta.nominalSize;
    const auto   SCALEDW = toPixels(SVGSIZE->first * SCALE);
    const auto   SCALEDH = toPixels(SVGSIZE->second * SCALE);
    const auto   HOTX    = toPixels(meta.hotspotX * SCALE);
    const auto   HOTY    = toPixels(meta.hotspotY * SCALE);

    if (!SCALEDW || !SCALEDH)
        return malformed(std::format("{} doesn't fit a surface at size {} (scale {})", PATH, size, SCALE));

    if (!HOTX || !HOTY)
        return malformed(std::format("{} has an out of range hotspot at size {}", PATH, size));

    const uint32_t WIDTH  = *SCALEDW;
    const uint32_t HEIGHT = *SCALEDH;

    if (WIDTH == 0 || HEIGHT == 0)
        return malformed(std::format("{} renders to an empty {}x{} image at size {}", PATH, WIDTH, HEIGHT, size));

    auto*       surface = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, WIDTH, HEIGHT);
    CScopeGuard surfaceGuard([surface] { cairo_surface_destroy(surface); });

    if (const auto STATUS = cairo_surface_status(surface); STATUS != CAIRO_STATUS_SUCCESS)
        return malformed(std::format("can't allocate a {}x{} surface: {}", WIDTH, HEIGHT, cairo_status_to_string(STATUS)));

    auto*       cairo = cairo_create(surface);
    CScopeGuard cairoGuard([cairo] { cairo_destroy(cairo); });

    cairo_scale(cairo, SCALE, SCALE);

    const RsvgRectangle VIEWPORT = {.x = 0, .y = 0, .width = SVGSIZE->first, .height = SVGSIZE->second};
    if (!rsvg_handle_render_document(handle, cairo, &VIEWPORT, &error)) {
        std::string msg = error ? error->message : "unknown error";
        if (error)
            g_error_free(error);
        return malformed(std::format("can't render {}: {}", PATH, msg));
    }

    cairo_surface_flush(surface);

    SImage image;
    image.size   = size;
    image.width  = WIDTH;
    image.height = HEIGHT;
    image.xhot   = *HOTX;
    image.yhot   = *HOTY;
    image.delay  = meta.delay.value_or(0);

    // cairo ARGB32 is premultiplied, native endian words with a row stride
    const auto*  data   = cairo_image_surface_get_data(surface);
    const size_t STRIDE = cairo_image_surface_get_stride(surface);

    image.pixels.resize(sc<size_t>(WIDTH) * HEIGHT * 4);
    for (size_t y = 0; y < HEIGHT; ++y) {
        for (size_t x = 0; x < WIDTH; ++x) {
            uint32_t px = 0;
            std::memcpy(&px, data + y * STRIDE + x * 4, sizeof(px));

            auto* out = &image.pixels[(y * WIDTH + x) * 4];
            out[0]    = (px >> 16) & 0xFF;
            out[1]    = (px >> 8) & 0xFF;
            out[2]    = px & 0xFF;
            out[3]    = (px >> 24) & 0xFF;
        }
    }

    return image;
}

FramesResult SvgCursorReader::load(const std::string& iconDir, uint32_t size) {
    const auto METAS = FrameMeta::read(iconDir);
    if (!METAS)
        return std::unexpected(METAS.error());

    std::vector<SImage> frames;
    frames.reserve(METAS->size());

    for (const auto& meta : *METAS) {
        auto frame = renderFrame(iconDir, meta, size);
        if (!frame) {
            Log::logger->log(Log::ERR, "SvgCursor: {} failed at size {}: {}", iconDir, size, frame.error().message);
            return std::unexpected(frame.error());
        }

        Log::logger->log(Log::TRACE, "SvgCursor: {} rendered {}", iconDir, *frame);
        frames.emplace_back(std::move(*frame));
    }

    return frames;
}
