#pragma once

#include <optional>
#include <string>
#include <vector>

#include "IconScanner.hpp"

namespace Kcursor {
    class CCursorTheme {
      public:
        /*
            Resolves a theme by name across the process' search path (see SearchPath::get()),
            following its Inherits= chain. Returns nullopt if neither the theme nor any of
            its ancestors provide a single icon. An empty name means "default".
        */
        static std::optional<CCursorTheme> load(const std::string& name);
        static std::optional<CCursorTheme> load(const std::string& name, const std::vector<std::string>& searchPaths);

        // nullptr if the theme doesn't have the shape
        SP<CCursorIcon>          icon(const std::string& shape) const;

        // icon(), falling back to the shape's legacy X11 name (wait -> watch, ...)
        SP<CCursorIcon>          iconOrLegacy(const std::string& shape) const;

        const std::string&       name() const;
        size_t                   size() const;
        std::vector<std::string> shapes() const;

      private:
        CCursorTheme(std::string name, IconCache&& cache);

        static void discover(const std::string& name, const std::vector<std::string>& searchPaths, IconCache& cache);

        std::string m_name;
        IconCache   m_cache;
    };
}
