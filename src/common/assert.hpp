#pragma once

#include <cassert>

#define GTB_ASSERT(condition)                                                                      \
    do                                                                                             \
    {                                                                                              \
        if (!(condition)) [[unlikely]]                                                             \
        {                                                                                          \
            assert(condition);                                                                     \
        }                                                                                          \
    } while (false)
