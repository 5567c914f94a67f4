#include <toybox/render_status.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string_view>

using namespace gtb;

TEST_CASE("Surface texture status maps to render status", "[render_status]")
{
    REQUIRE(toRenderStatus(WGPUSurfaceGetCurrentTextureStatus_Success) == RenderStatus::Success);
    REQUIRE(toRenderStatus(WGPUSurfaceGetCurrentTextureStatus_Timeout) == RenderStatus::Timeout);
    REQUIRE(toRenderStatus(WGPUSurfaceGetCurrentTextureStatus_Outdated) == RenderStatus::Outdated);
    REQUIRE(toRenderStatus(WGPUSurfaceGetCurrentTextureStatus_Lost) == RenderStatus::Lost);
    REQUIRE(
        toRenderStatus(WGPUSurfaceGetCurrentTextureStatus_OutOfMemory) ==
        RenderStatus::OutOfMemory);
    REQUIRE(
        toRenderStatus(WGPUSurfaceGetCurrentTextureStatus_DeviceLost) == RenderStatus::DeviceLost);
}

TEST_CASE("Unknown surface texture status is an error", "[render_status]")
{
    REQUIRE_THROWS_AS(
        toRenderStatus(static_cast<WGPUSurfaceGetCurrentTextureStatus>(0x7FFF0000)),
        std::runtime_error);
}

TEST_CASE("Render status names", "[render_status]")
{
    REQUIRE(std::string_view(renderStatusToStr(RenderStatus::Lost)) == "Lost");
    REQUIRE(std::string_view(renderStatusToStr(RenderStatus::OutOfMemory)) == "OutOfMemory");
}
