#pragma once

#include <optional>
#include <string>

namespace Kcursor::ThemeIndex {
    // first Inherits= value in an index.theme, nullopt if missing / unreadable / none declared
    std::optional<std::string> inherits(const std::string& indexPath);

    std::optional<std::string> parseInherits(const std::string& content);
}
