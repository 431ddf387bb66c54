#pragma once

#include <string>
#include <vector>

namespace Kcursor::SearchPath {
    /*
        Icon theme roots in lookup order: user data home, ~/.icons, then the
        system data dirs.

        Throws std::runtime_error when neither XDG_HOME nor HOME is set.
    */
    std::vector<std::string>        compute();

    // compute(), evaluated once per process. A throwing compute() is retried on the next call.
    const std::vector<std::string>& get();
}
