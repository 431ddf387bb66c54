#include "FrameMeta.hpp"
#include "../debug/log/Logger.hpp"

#include <filesystem>

#include <glaze/glaze.hpp>
#include <hyprutils/os/File.hpp>
#include <hyprutils/string/String.hpp>

using namespace Kcursor;

template <>
struct glz::meta<Kcursor::SFrameMeta> {
    using T                     = Kcursor::SFrameMeta;
    static constexpr auto value = glz::object("filename", &T::filename, "hotspot_x", &T::hotspotX, "hotspot_y", &T::hotspotY, "nominal_size", &T::nominalSize, "delay", &T::delay);
};

// optional members (delay) may be left out, everything else is required
constexpr glz::opts FRAME_META_OPTS = {.error_on_unknown_keys = false, .error_on_missing_keys = true};

std::expected<std::vector<SFrameMeta>, SFramesError> FrameMeta::parse(const std::string& json) {
    std::vector<SFrameMeta> metas;

    if (Hyprutils::String::trim(json).empty())
        return std::unexpected(SFramesError{FRAMES_ERROR_NOT_FOUND, "metadata is empty"});

    if (const auto PARSE_ERR = glz::read<FRAME_META_OPTS>(metas, json); PARSE_ERR)
        return std::unexpected(SFramesError{FRAMES_ERROR_MALFORMED, glz::format_error(PARSE_ERR, json)});

    if (metas.empty())
        return std::unexpected(SFramesError{FRAMES_ERROR_NOT_FOUND, "metadata lists no frames"});

    for (const auto& meta : metas) {
        if (meta.nominalSize <= 0)
            return std::unexpected(SFramesError{FRAMES_ERROR_MALFORMED, std::format("frame {} has a nominal_size of {}", meta.filename, meta.nominalSize)});
    }

    return metas;
}

std::expected<std::vector<SFrameMeta>, SFramesError> FrameMeta::read(const std::string& iconDir) {
    const auto PATH    = (std::filesystem::path{iconDir} / "metadata.json").string();
    const auto CONTENT = Hyprutils::File::readFileAsString(PATH);

    if (!CONTENT) {
        Log::logger->log(Log::DEBUG, "FrameMeta: can't read {}: {}", PATH, CONTENT.error());
        return std::unexpected(SFramesError{FRAMES_ERROR_NOT_FOUND, std::format("can't read {}", PATH)});
    }

    auto metas = parse(*CONTENT);
    if (!metas && metas.error().type == FRAMES_ERROR_MALFORMED)
        Log::logger->log(Log::ERR, "FrameMeta: {} is malformed: {}", PATH, metas.error().message);

    return metas;
}
