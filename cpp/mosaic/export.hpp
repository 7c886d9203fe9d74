// export.hpp - DLL export/import macros for cross-platform builds
#pragma once

#ifdef _WIN32
    #ifdef MOSAIC_LIB_EXPORTS
        #define MOSAIC_API __declspec(dllexport)
    #else
        #define MOSAIC_API __declspec(dllimport)
    #endif
#else
    #define MOSAIC_API __attribute__((visibility("default")))
#endif
