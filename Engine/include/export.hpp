#pragma once

#if defined(_WIN32)
    #if defined(SEED_EXPORT)
        #define SEED_API __declspec(dllexport)
    #else
        #define SEED_API __declspec(dllimport)
    #endif
#else
    #define SEED_API __attribute__((visibility("default")))
#endif
