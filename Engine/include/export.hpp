#pragma once

#if defined(GLOSSA_STATIC)
    #define GLOSSA_API
#elif defined(_WIN32)
    #if defined(GLOSSA_EXPORT)
        #define GLOSSA_API __declspec(dllexport)
    #else
        #define GLOSSA_API __declspec(dllimport)
    #endif
#else
    #define GLOSSA_API __attribute__((visibility("default")))
#endif
