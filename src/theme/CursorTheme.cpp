#include "CursorTheme.hpp"
#include "SearchPath.hpp"
#include "ThemeIndex.hpp"
#include "../debug/log/Logger.hpp"
#include "../helpers/CursorShapes.hpp"

#include <algorithm>
#include <filesystem>
#include <unordered_set>

using namespace Kcursor;

CCursorTheme::CCursorTheme(std::string name, IconCache&& cache) : m_name(std::move(name)), m_cache(std::move(cache)) {
    ;
}

std::optional<CCursorTheme> CCursorTheme::load(const std::string& name) {
    return load(name, SearchPath::get());
}

std::optional<CCursorTheme> CCursorTheme::load(const std::string& name, const std::vector<std::string>& searchPaths) {
    const auto THEMENAME = name.empty() ? std::string{"default"} : name;

    IconCache  cache;
    discover(THEMENAME, searchPaths, cache);

    if (cache.empty()) {
        Log::logger->log(Log::WARN, "CursorTheme: no shapes found for theme \"{}\"", THEMENAME);
        return std::nullopt;
    }

    Log::logger->log(Log::DEBUG, "CursorTheme: loaded \"{}\" with {} shapes", THEMENAME, cache.size());

    return CCursorTheme(THEMENAME, std::move(cache));
}

void CCursorTheme::discover(const std::string& name, const std::vector<std::string>& searchPaths, IconCache& cache) {
    std::vector<std::string>        stack = {name};
    std::unordered_set<std::string> visited;

    while (!stack.empty()) {
        const auto THEME = std::move(stack.back());
        stack.pop_back();

        if (!visited.emplace(THEME).second) {
            Log::logger->log(Log::WARN, "CursorTheme: inheritance cycle through \"{}\" while loading \"{}\", stopping there", THEME, name);
            continue;
        }

        Log::logger->log(Log::DEBUG, "CursorTheme: scanning theme {}", THEME);

        std::optional<std::string> inherits;

        for (const auto& root : searchPaths) {
            std::error_code ec;
            const auto      THEMEDIR = std::filesystem::path{root} / THEME;

            if (!std::filesystem::is_directory(THEMEDIR, ec) || ec)
                continue;

            // a root provides either svg or xcursor shapes, svg first
            if (const auto SCALABLE = THEMEDIR / "cursors_scalable"; std::filesystem::is_directory(SCALABLE, ec) && !ec) {
                Log::logger->log(Log::DEBUG, "CursorTheme: using svg cursors from {}", SCALABLE.string());
                IconScanner::scan(SCALABLE.string(), CURSOR_FORMAT_SVG, cache);
            } else if (const auto XCURSORS = THEMEDIR / "cursors"; std::filesystem::is_directory(XCURSORS, ec) && !ec) {
                Log::logger->log(Log::DEBUG, "CursorTheme: using xcursors from {}", XCURSORS.string());
                IconScanner::scan(XCURSORS.string(), CURSOR_FORMAT_XCURSOR, cache);
            }

            if (!inherits) {
                inherits = ThemeIndex::inherits((THEMEDIR / "index.theme").string());
                if (inherits)
                    Log::logger->log(Log::DEBUG, "CursorTheme: theme {} inherits {}", THEME, *inherits);
            }
        }

        if (inherits)
            stack.emplace_back(std::move(*inherits));
    }
}

SP<CCursorIcon> CCursorTheme::icon(const std::string& shape) const {
    const auto IT = m_cache.find(shape);
    if (IT == m_cache.end())
        return nullptr;

    return IT->second;
}

SP<CCursorIcon> CCursorTheme::iconOrLegacy(const std::string& shape) const {
    if (auto found = icon(shape))
        return found;

    const auto LEGACY = legacyShapeName(shape);
    if (LEGACY.empty())
        return nullptr;

    Log::logger->log(Log::TRACE, "CursorTheme: {} has no shape {}, trying legacy name {}", m_name, shape, LEGACY);

    return icon(LEGACY);
}

const std::string& CCursorTheme::name() const {
    return m_name;
}

size_t CCursorTheme::size() const {
    return m_cache.size();
}

std::vector<std::string> CCursorTheme::shapes() const {
    std::vector<std::string> result;
    result.reserve(m_cache.size());

    for (const auto& [shape, _] : m_cache) {
        result.emplace_back(shape);
    }

    std::ranges::sort(result);

    return result;
}
