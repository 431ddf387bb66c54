#include "Env.hpp"

#include <cstdlib>
#include <string_view>

bool Kcursor::Env::envEnabled(const std::string& env) {
    auto ret = getenv(env.c_str());
    if (!ret)
        return false;

    const std::string_view sv = ret;

    return !sv.empty() && sv != "0";
}

std::optional<std::string> Kcursor::Env::envValue(const std::string& env) {
    const auto ret = getenv(env.c_str());
    if (!ret || ret[0] == '\0')
        return std::nullopt;

    return std::string{ret};
}

bool Kcursor::Env::isTrace() {
    static bool TRACE = envEnabled("KCURSOR_TRACE");
    return TRACE;
}
