#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "CursorIcon.hpp"

namespace Kcursor {
    // one entry of an svg cursor's metadata.json
    struct SFrameMeta {
        std::string             filename;

        // in unscaled svg units
        double                  hotspotX    = 0;
        double                  hotspotY    = 0;
        double                  nominalSize = 0;

        std::optional<uint32_t> delay;
    };

    namespace FrameMeta {
        /*
            Reads metadata.json from an svg cursor directory. A missing or empty
            document is NOT_FOUND, one that does not parse is MALFORMED.
        */
        std::expected<std::vector<SFrameMeta>, SFramesError> read(const std::string& iconDir);

        std::expected<std::vector<SFrameMeta>, SFramesError> parse(const std::string& json);
    }
}
