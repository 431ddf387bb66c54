#include "IconScanner.hpp"
#include "../debug/log/Logger.hpp"

#include <filesystem>
#include <vector>

using namespace Kcursor;

static SP<CCursorIcon> makeIcon(const std::filesystem::path& path, eCursorFormat format) {
    if (format == CURSOR_FORMAT_SVG)
        return makeShared<CCursorIcon>(SSvgCursorSource{.path = path.string()});

    return makeShared<CCursorIcon>(SXCursorSource{.path = path.string()});
}

void IconScanner::scan(const std::string& dir, eCursorFormat format, IconCache& cache) {
    std::error_code                     ec;
    std::vector<std::filesystem::path>  entries, symlinks;
    std::filesystem::directory_iterator it(dir, ec);

    if (ec) {
        Log::logger->log(Log::WARN, "IconScanner: can't read {}: {}", dir, ec.message());
        return;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            Log::logger->log(Log::WARN, "IconScanner: listing {} failed midway: {}", dir, ec.message());
            break;
        }

        std::error_code linkEc;
        const bool      IS_SYMLINK = it->is_symlink(linkEc);
        if (linkEc) {
            Log::logger->log(Log::TRACE, "IconScanner: can't stat {}: {}", it->path().string(), linkEc.message());
            continue;
        }

        (IS_SYMLINK ? symlinks : entries).emplace_back(it->path());
    }

    for (const auto& path : entries) {
        auto shape = path.filename().string();
        if (cache.contains(shape))
            continue;

        cache.emplace(std::move(shape), makeIcon(path, format));
    }

    if (symlinks.empty())
        return;

    const auto CANONICAL_DIR = std::filesystem::canonical(dir, ec);
    if (ec) {
        Log::logger->log(Log::WARN, "IconScanner: can't canonicalize {}: {}", dir, ec.message());
        return;
    }

    for (const auto& path : symlinks) {
        auto shape = path.filename().string();
        if (cache.contains(shape))
            continue;

        const auto TARGET = std::filesystem::canonical(path, ec);
        if (ec) {
            Log::logger->log(Log::TRACE, "IconScanner: dangling symlink {}: {}", path.string(), ec.message());
            continue;
        }

        if (TARGET.parent_path() != CANONICAL_DIR) {
            Log::logger->log(Log::TRACE, "IconScanner: {} points outside of {}, ignoring", path.string(), dir);
            continue;
        }

        const auto ALIAS = cache.find(TARGET.filename().string());
        if (ALIAS == cache.end()) {
            Log::logger->log(Log::TRACE, "IconScanner: {} points to unknown shape {}", path.string(), TARGET.filename().string());
            continue;
        }

        Log::logger->log(Log::TRACE, "IconScanner: {} is an alias of {}", shape, ALIAS->first);
        cache.emplace(std::move(shape), ALIAS->second);
    }
}
