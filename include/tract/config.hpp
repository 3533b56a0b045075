#pragma once
#ifndef TRACT_API
#if defined(_WIN32) || defined(__CYGWIN__)
#define TRACT_PLATFORM_WINDOWS 1
#else
#define TRACT_PLATFORM_WINDOWS 0
#endif
#if TRACT_PLATFORM_WINDOWS
#if defined(TRACT_BUILD_SHARED)
#define TRACT_API __declspec(dllexport)
#elif defined(TRACT_SHARED)
#define TRACT_API __declspec(dllimport)
#else
#define TRACT_API
#endif
#else
#if defined(TRACT_BUILD_SHARED) || defined(TRACT_SHARED)
#if __GNUC__ >= 4
#define TRACT_API __attribute__((visibility("default")))
#else
#define TRACT_API
#endif // __GNUC__
#else
#define TRACT_API
#endif // TRACT_BUILD_SHARED || TRACT_SHARED
#endif // TRACT_PLATFORM_WINDOWS
#endif // TRACT_API
