#pragma once

#if defined(FAULTHUSH_STATIC)
    #define FAULTHUSH_API
    #define FAULTHUSH_LOCAL
#elif defined(_WIN32) || defined(__CYGWIN__)
    #if defined(FAULTHUSH_BUILDING_LIBRARY)
        #define FAULTHUSH_API __declspec(dllexport)
    #else
        #define FAULTHUSH_API __declspec(dllimport)
    #endif
    #define FAULTHUSH_LOCAL
#else
    #if defined(__GNUC__) || defined(__clang__)
        #define FAULTHUSH_API __attribute__((visibility("default")))
        #define FAULTHUSH_LOCAL __attribute__((visibility("hidden")))
    #else
        #define FAULTHUSH_API
        #define FAULTHUSH_LOCAL
    #endif
#endif
