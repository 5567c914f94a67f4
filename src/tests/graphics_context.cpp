#include <toybox/graphics_context.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace gtb;

TEST_CASE("Frames are cleared to a fixed color", "[graphics_context]")
{
    const WGPURenderPassColorAttachment attachment = clearColorAttachment(nullptr);

    REQUIRE(attachment.loadOp == WGPULoadOp_Clear);
    REQUIRE(attachment.storeOp == WGPUStoreOp_Store);
    REQUIRE(attachment.resolveTarget == nullptr);
    REQUIRE(attachment.depthSlice == WGPU_DEPTH_SLICE_UNDEFINED);

    REQUIRE(attachment.clearValue.r == 0.1);
    REQUIRE(attachment.clearValue.g == 0.2);
    REQUIRE(attachment.clearValue.b == 0.3);
    REQUIRE(attachment.clearValue.a == 1.0);
}
