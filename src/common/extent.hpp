#pragma once

#include <algorithm>
#include <cstdint>

namespace gtb
{
// A two-dimensional size in pixels or screen coordinates.
template<typename T>
struct Extent2
{
    T width = T(0);
    T height = T(0);

    constexpr Extent2() noexcept = default;

    constexpr Extent2(T w, T h) noexcept
        : width(w),
          height(h)
    {
    }

    constexpr bool operator==(const Extent2& rhs) const noexcept = default;
};

using Extent2i = Extent2<std::int32_t>;
using Extent2u = Extent2<std::uint32_t>;

// True when either dimension is zero. Such an extent can not back a surface.
template<typename T>
constexpr bool hasZeroArea(const Extent2<T>& extent) noexcept
{
    return extent.width == T(0) || extent.height == T(0);
}

// GLFW reports sizes as signed ints. Negative values are clamped to zero.
constexpr Extent2u toExtent2u(const Extent2i& extent) noexcept
{
    return Extent2u{
        static_cast<std::uint32_t>(std::max(extent.width, 0)),
        static_cast<std::uint32_t>(std::max(extent.height, 0))};
}
} // namespace gtb
