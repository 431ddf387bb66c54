#pragma once

#include <optional>
#include <string>

namespace Kcursor::Env {
    // set, non-empty and not "0"
    bool                       envEnabled(const std::string& env);

    // unset and empty are both treated as absent
    std::optional<std::string> envValue(const std::string& env);

    bool                       isTrace();
}
