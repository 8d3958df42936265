#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(CHATVAULT_EXPORTS)
    #define CV_API __declspec(dllexport)
  #elif defined(CHATVAULT_SHARED)
    #define CV_API __declspec(dllimport)
  #else
    #define CV_API
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define CV_API __attribute__((visibility("default")))
#else
  #define CV_API
#endif
