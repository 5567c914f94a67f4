#include "surface_config.hpp"

#include <algorithm>
#include <stdexcept>

namespace gtb
{
bool isSrgbFormat(const WGPUTextureFormat format) noexcept
{
    switch (format)
    {
    case WGPUTextureFormat_RGBA8UnormSrgb:
    case WGPUTextureFormat_BGRA8UnormSrgb:
    case WGPUTextureFormat_BC1RGBAUnormSrgb:
    case WGPUTextureFormat_BC2RGBAUnormSrgb:
    case WGPUTextureFormat_BC3RGBAUnormSrgb:
    case WGPUTextureFormat_BC7RGBAUnormSrgb:
    case WGPUTextureFormat_ETC2RGB8UnormSrgb:
    case WGPUTextureFormat_ETC2RGB8A1UnormSrgb:
    case WGPUTextureFormat_ETC2RGBA8UnormSrgb:
    case WGPUTextureFormat_ASTC4x4UnormSrgb:
    case WGPUTextureFormat_ASTC5x4UnormSrgb:
    case WGPUTextureFormat_ASTC5x5UnormSrgb:
    case WGPUTextureFormat_ASTC6x5UnormSrgb:
    case WGPUTextureFormat_ASTC6x6UnormSrgb:
    case WGPUTextureFormat_ASTC8x5UnormSrgb:
    case WGPUTextureFormat_ASTC8x6UnormSrgb:
    case WGPUTextureFormat_ASTC8x8UnormSrgb:
    case WGPUTextureFormat_ASTC10x5UnormSrgb:
    case WGPUTextureFormat_ASTC10x6UnormSrgb:
    case WGPUTextureFormat_ASTC10x8UnormSrgb:
    case WGPUTextureFormat_ASTC10x10UnormSrgb:
    case WGPUTextureFormat_ASTC12x10UnormSrgb:
    case WGPUTextureFormat_ASTC12x12UnormSrgb:
        return true;
    default:
        return false;
    }
}

WGPUTextureFormat selectSurfaceFormat(const std::span<const WGPUTextureFormat> formats)
{
    if (formats.empty())
    {
        throw std::invalid_argument("Surface reports no supported texture formats.");
    }

    const auto it = std::find_if(formats.begin(), formats.end(), isSrgbFormat);
    return it != formats.end() ? *it : formats.front();
}

SurfaceConfig selectSurfaceConfig(const SurfaceCapabilities& capabilities, const Extent2u size)
{
    if (capabilities.presentModes.empty())
    {
        throw std::invalid_argument("Surface reports no supported present modes.");
    }

    if (capabilities.alphaModes.empty())
    {
        throw std::invalid_argument("Surface reports no supported alpha modes.");
    }

    return SurfaceConfig{
        .format = selectSurfaceFormat(capabilities.formats),
        .width = size.width,
        .height = size.height,
        .presentMode = capabilities.presentModes.front(),
        .alphaMode = capabilities.alphaModes.front(),
        .maxFrameLatency = MAX_FRAME_LATENCY,
    };
}

bool resizeSurfaceConfig(SurfaceConfig& config, const Extent2u newSize) noexcept
{
    if (hasZeroArea(newSize))
    {
        return false;
    }

    config.width = newSize.width;
    config.height = newSize.height;

    return true;
}
} // namespace gtb
