#pragma once

#include <webgpu/webgpu.h>

#include <cstdint>
#include <string>
#include <vector>

namespace gtb
{
struct AdapterInfo
{
    std::string     name;
    std::string     vendor;
    std::string     architecture;
    std::string     driver;
    std::uint32_t   vendorId = 0;
    std::uint32_t   deviceId = 0;
    WGPUAdapterType adapterType = WGPUAdapterType_Unknown;
    WGPUBackendType backendType = WGPUBackendType_Undefined;
};

AdapterInfo getAdapterInfo(WGPUAdapter);

// Single line description, e.g. `NVIDIA GeForce RTX 3070 (DiscreteGPU, Vulkan, vendor 0x10de,
// device 0x2484, driver "...")`.
std::string formatAdapterInfo(const AdapterInfo&);

// Collects every adapter that can be requested from the instance, probing each backend with both
// power preferences and with the fallback adapter. Duplicates are reported once.
std::vector<AdapterInfo> enumerateAdapters(WGPUInstance);

// The adapter picked by a request with default options. Throws std::runtime_error if there is none.
AdapterInfo defaultAdapterInfo(WGPUInstance);

// Logs the available adapters and the default adapter. Diagnostics only: runs on its own instance.
void reportAdapters();
} // namespace gtb
