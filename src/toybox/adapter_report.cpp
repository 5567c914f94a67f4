#include "adapter_report.hpp"
#include "webgpu_utils.hpp"

#include <common/logger.hpp>
#include <common/platform.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <stdexcept>

namespace gtb
{
namespace
{
bool sameAdapter(const AdapterInfo& lhs, const AdapterInfo& rhs)
{
    return lhs.backendType == rhs.backendType && lhs.vendorId == rhs.vendorId &&
           lhs.deviceId == rhs.deviceId && lhs.name == rhs.name;
}

const char* orEmpty(const char* const str) { return str ? str : ""; }
} // namespace

AdapterInfo getAdapterInfo(const WGPUAdapter adapter)
{
    WGPUAdapterProperties properties = {};
    wgpuAdapterGetProperties(adapter, &properties);

    AdapterInfo info{
        .name = orEmpty(properties.name),
        .vendor = orEmpty(properties.vendorName),
        .architecture = orEmpty(properties.architecture),
        .driver = orEmpty(properties.driverDescription),
        .vendorId = properties.vendorID,
        .deviceId = properties.deviceID,
        .adapterType = properties.adapterType,
        .backendType = properties.backendType,
    };

    wgpuAdapterPropertiesFreeMembers(properties);

    return info;
}

std::string formatAdapterInfo(const AdapterInfo& info)
{
    std::string result = fmt::format(
        "{} ({}, {}, vendor {:#06x}, device {:#06x}",
        info.name.empty() ? "<unnamed>" : info.name,
        WGPUAdapterTypeToStr(info.adapterType),
        WGPUBackendTypeToStr(info.backendType),
        info.vendorId,
        info.deviceId);

    if (!info.architecture.empty())
    {
        result += fmt::format(", architecture \"{}\"", info.architecture);
    }

    if (!info.driver.empty())
    {
        result += fmt::format(", driver \"{}\"", info.driver);
    }

    result += ')';

    return result;
}

std::vector<AdapterInfo> enumerateAdapters(const WGPUInstance instance)
{
    constexpr std::array<WGPUBackendType, 6> backendTypes{
        WGPUBackendType_D3D12,
        WGPUBackendType_D3D11,
        WGPUBackendType_Metal,
        WGPUBackendType_Vulkan,
        WGPUBackendType_OpenGL,
        WGPUBackendType_OpenGLES,
    };

    struct Probe
    {
        WGPUPowerPreference powerPreference;
        bool                forceFallbackAdapter;
    };
    constexpr std::array<Probe, 3> probes{{
        {WGPUPowerPreference_HighPerformance, false},
        {WGPUPowerPreference_LowPower, false},
        {WGPUPowerPreference_Undefined, true},
    }};

    std::vector<AdapterInfo> adapters;
    for (const WGPUBackendType backendType : backendTypes)
    {
        for (const Probe& probe : probes)
        {
            WGPURequestAdapterOptions options = {};
            options.powerPreference = probe.powerPreference;
            options.backendType = backendType;
            options.forceFallbackAdapter = probe.forceFallbackAdapter;

            const WGPUAdapter adapter = requestAdapter(instance, options);
            if (!adapter)
            {
                continue;
            }

            AdapterInfo info = getAdapterInfo(adapter);
            adapterSafeRelease(adapter);

            const bool known = std::any_of(
                adapters.begin(), adapters.end(), [&info](const AdapterInfo& other) {
                    return sameAdapter(info, other);
                });
            if (!known)
            {
                adapters.push_back(std::move(info));
            }
        }
    }

    return adapters;
}

AdapterInfo defaultAdapterInfo(const WGPUInstance instance)
{
    const WGPURequestAdapterOptions options = {};
    const WGPUAdapter               adapter = requestAdapter(instance, options);
    if (!adapter)
    {
        throw std::runtime_error("Failed to request the default WGPUAdapter.");
    }

    AdapterInfo info = getAdapterInfo(adapter);
    adapterSafeRelease(adapter);

    return info;
}

void reportAdapters()
{
    const WGPUInstanceDescriptor instanceDesc{
        .nextInChain = nullptr,
    };
    const WGPUInstance instance = wgpuCreateInstance(&instanceDesc);
    if (!instance)
    {
        throw std::runtime_error("Failed to create WGPUInstance instance.");
    }

    try
    {
#if GTB_PLATFORM != GTB_EMSCRIPTEN
        logInfo("Available adapters:");
        for (const AdapterInfo& info : enumerateAdapters(instance))
        {
            logInfo("    {}", formatAdapterInfo(info));
        }
#endif

        logInfo("Default adapter: {}", formatAdapterInfo(defaultAdapterInfo(instance)));
    }
    catch (...)
    {
        instanceSafeRelease(instance);
        throw;
    }

    instanceSafeRelease(instance);
}
} // namespace gtb
