#include "ThemeIndex.hpp"
#include "../debug/log/Logger.hpp"

#include <sstream>
#include <string_view>

#include <hyprutils/os/File.hpp>

using namespace Kcursor;

constexpr std::string_view INHERITS = "Inherits";

static bool isSeparator(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f' || c == ',' || c == ';';
}

static bool isWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::optional<std::string> ThemeIndex::parseInherits(const std::string& content) {
    std::istringstream stream(content);
    std::string        line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (!line.starts_with(INHERITS))
            continue;

        size_t pos = INHERITS.size();
        while (pos < line.size() && isWhitespace(line[pos])) {
            pos++;
        }

        // not correctly formatted, e.g. InheritsFoo=bar
        if (pos >= line.size() || line[pos] != '=')
            continue;

        pos++;
        while (pos < line.size() && isSeparator(line[pos])) {
            pos++;
        }

        size_t end = pos;
        while (end < line.size() && !isSeparator(line[end])) {
            end++;
        }

        if (end == pos)
            continue;

        return line.substr(pos, end - pos);
    }

    return std::nullopt;
}

std::optional<std::string> ThemeIndex::inherits(const std::string& indexPath) {
    const auto CONTENT = Hyprutils::File::readFileAsString(indexPath);
    if (!CONTENT)
        return std::nullopt;

    Log::logger->log(Log::TRACE, "ThemeIndex: parsing {}", indexPath);

    return parseInherits(*CONTENT);
}
