#include "CursorIcon.hpp"
#include "XCursorReader.hpp"
#include "SvgCursorReader.hpp"

#include <type_traits>
#include <utility>

using namespace Kcursor;

CCursorIcon::CCursorIcon(SXCursorSource source) : m_source(std::move(source)) {
    ;
}

CCursorIcon::CCursorIcon(SSvgCursorSource source) : m_source(std::move(source)) {
    ;
}

FramesResult CCursorIcon::frames(uint32_t size) const {
    return std::visit(
        [size](const auto& source) -> FramesResult {
            using T = std::decay_t<decltype(source)>;
            if constexpr (std::is_same_v<T, SXCursorSource>)
                return XCursorReader::load(source.path, size);
            else
                return SvgCursorReader::load(source.path, size);
        },
        m_source);
}

eCursorFormat CCursorIcon::format() const {
    return std::holds_alternative<SXCursorSource>(m_source) ? CURSOR_FORMAT_XCURSOR : CURSOR_FORMAT_SVG;
}

const std::string& CCursorIcon::path() const {
    return std::visit([](const auto& source) -> const std::string& { return source.path; }, m_source);
}
