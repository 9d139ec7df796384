#pragma once

#ifndef BOUND_CORE_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(BOUND_CORE_SHARED_BUILD)
#define BOUND_CORE_API __declspec(dllexport)
#elif defined(BOUND_CORE_SHARED)
#define BOUND_CORE_API __declspec(dllimport)
#else
#define BOUND_CORE_API
#endif
#else
#if defined(BOUND_CORE_SHARED_BUILD) || defined(BOUND_CORE_SHARED)
#define BOUND_CORE_API __attribute__((visibility("default")))
#else
#define BOUND_CORE_API
#endif
#endif
#endif

namespace BOUND
{
    [[noreturn]] inline void Unreachable()
    {
#if defined(_MSC_VER) && !defined(__clang__)// MSVC
        __assume(false);
#else// GCC, Clang
        __builtin_unreachable();
#endif
    }
}// namespace BOUND
