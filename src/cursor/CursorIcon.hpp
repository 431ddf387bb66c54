#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <variant>
#include <vector>

#include "Image.hpp"

namespace Kcursor {
    enum eCursorFormat : uint8_t {
        CURSOR_FORMAT_XCURSOR,
        CURSOR_FORMAT_SVG,
    };

    enum eFramesError : uint8_t {
        FRAMES_ERROR_NOT_FOUND, // nothing to decode: missing, unreadable or empty source
        FRAMES_ERROR_MALFORMED, // the source exists but can't be decoded / rendered
    };

    struct SFramesError {
        eFramesError type = FRAMES_ERROR_NOT_FOUND;
        std::string  message;
    };

    using FramesResult = std::expected<std::vector<SImage>, SFramesError>;

    // a single file with all sizes embedded
    struct SXCursorSource {
        std::string path;
    };

    // a directory with metadata.json and one svg per frame
    struct SSvgCursorSource {
        std::string path;
    };

    class CCursorIcon {
      public:
        explicit CCursorIcon(SXCursorSource source);
        explicit CCursorIcon(SSvgCursorSource source);
        ~CCursorIcon() = default;

        /*
            Decodes (xcursor) or renders (svg) all frames for the requested size.
            Nothing is cached, every call reads the icon from disk again.
        */
        FramesResult       frames(uint32_t size) const;

        eCursorFormat      format() const;
        const std::string& path() const;

      private:
        std::variant<SXCursorSource, SSvgCursorSource> m_source;
    };
}
