#include "SearchPath.hpp"
#include "../debug/log/Logger.hpp"
#include "../helpers/env/Env.hpp"

#include <filesystem>
#include <stdexcept>

#include <hyprutils/string/VarList2.hpp>

using namespace Kcursor;
using namespace Hyprutils::String;

constexpr const char* DEFAULT_SYSTEM_ICONS = "/usr/share/icons";

static std::string homeDir() {
    if (auto home = Env::envValue("XDG_HOME"))
        return *home;

    if (auto home = Env::envValue("HOME"))
        return *home;

    Log::logger->log(Log::CRIT, "SearchPath: neither $XDG_HOME nor $HOME is set, can't locate user icon themes");
    throw std::runtime_error("SearchPath: $HOME is not set");
}

std::vector<std::string> SearchPath::compute() {
    const std::filesystem::path HOME = homeDir();
    std::vector<std::string>    paths;

    if (const auto DATA_HOME = Env::envValue("XDG_DATA_HOME"))
        paths.emplace_back((std::filesystem::path{*DATA_HOME} / "icons").string());
    else
        paths.emplace_back((HOME / ".local/share/icons").string());

    paths.emplace_back((HOME / ".icons").string());

    if (const auto DATA_DIRS = Env::envValue("XDG_DATA_DIRS")) {
        CVarList2 dirs(std::string{*DATA_DIRS}, 0, ':', true);
        for (const auto& d : dirs) {
            paths.emplace_back((std::filesystem::path{d} / "icons").string());
        }
    } else
        paths.emplace_back(DEFAULT_SYSTEM_ICONS);

    return paths;
}

const std::vector<std::string>& SearchPath::get() {
    // function-local static: initialized once, thread-safe, retried if compute() throws
    static const std::vector<std::string> PATHS = [] {
        auto paths = compute();
        for (const auto& p : paths) {
            Log::logger->log(Log::DEBUG, "SearchPath: theme root {}", p);
        }
        return paths;
    }();

    return PATHS;
}
