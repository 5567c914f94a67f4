#include <toybox/adapter_report.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace gtb;

TEST_CASE("Adapter info formatting", "[adapter_report]")
{
    AdapterInfo info{
        .name = "Test GPU",
        .vendor = "Test vendor",
        .architecture = "",
        .driver = "",
        .vendorId = 0x10de,
        .deviceId = 0x2484,
        .adapterType = WGPUAdapterType_DiscreteGPU,
        .backendType = WGPUBackendType_Vulkan,
    };

    SECTION("without optional fields")
    {
        REQUIRE(
            formatAdapterInfo(info) ==
            "Test GPU (DiscreteGPU, Vulkan, vendor 0x10de, device 0x2484)");
    }

    SECTION("with architecture and driver")
    {
        info.architecture = "ampere";
        info.driver = "550.54";
        REQUIRE(
            formatAdapterInfo(info) ==
            "Test GPU (DiscreteGPU, Vulkan, vendor 0x10de, device 0x2484, architecture "
            "\"ampere\", driver \"550.54\")");
    }

    SECTION("unnamed software adapter")
    {
        info.name.clear();
        info.adapterType = WGPUAdapterType_CPU;
        info.vendorId = 0x1ae0;
        info.deviceId = 0xc0de;
        REQUIRE(
            formatAdapterInfo(info) ==
            "<unnamed> (CPU, Vulkan, vendor 0x1ae0, device 0xc0de)");
    }
}
