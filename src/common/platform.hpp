#pragma once

#define GTB_MACOS 1
#define GTB_WINDOWS 2
#define GTB_EMSCRIPTEN 3
#define GTB_LINUX 4

#define GTB_UNKNOWN 0xFFFF

#if defined(__EMSCRIPTEN__)
#define GTB_PLATFORM GTB_EMSCRIPTEN
#elif defined(_WIN32)
#define GTB_PLATFORM GTB_WINDOWS
#elif defined(__APPLE__)
#define GTB_PLATFORM GTB_MACOS
#elif defined(__linux__)
#define GTB_PLATFORM GTB_LINUX
#else
#define GTB_PLATFORM GTB_UNKNOWN
#endif

static_assert(GTB_PLATFORM != GTB_UNKNOWN, "Platform detection failed.");
