#pragma once

#include <hyprutils/memory/SharedPtr.hpp>
#include <hyprutils/memory/UniquePtr.hpp>
#include <hyprutils/memory/Casts.hpp>

using namespace Hyprutils::Memory;

namespace Kcursor {
    template <typename T>
    using SP = Hyprutils::Memory::CSharedPointer<T>;
    template <typename T>
    using UP = Hyprutils::Memory::CUniquePointer<T>;
}
