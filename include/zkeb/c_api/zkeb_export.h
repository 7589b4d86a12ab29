#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(ZKEB_EXPORTS)
    #define ZKEB_API __declspec(dllexport)
  #elif defined(ZKEB_SHARED)
    #define ZKEB_API __declspec(dllimport)
  #else
    #define ZKEB_API
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define ZKEB_API __attribute__((visibility("default")))
#else
  #define ZKEB_API
#endif
