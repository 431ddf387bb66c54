#pragma once

#include <string>
#include <unordered_map>

#include "../cursor/CursorIcon.hpp"
#include "../helpers/memory/Memory.hpp"

namespace Kcursor {
    // shape name -> icon, aliases share the handle of their target
    using IconCache = std::unordered_map<std::string, SP<CCursorIcon>>;

    namespace IconScanner {
        /*
            Adds every shape in dir (a theme's cursors/ or cursors_scalable/) to
            cache. Shapes already present are kept. Symlinks are resolved after
            all regular entries and only alias siblings in the same directory.
            An unreadable dir adds nothing.
        */
        void scan(const std::string& dir, eCursorFormat format, IconCache& cache);
    }
}
