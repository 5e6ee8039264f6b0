#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_DISPATCH_STATIC)
    #define NGIN_DISPATCH_API
  #else
    #if defined(NGIN_DISPATCH_EXPORTS)
      #define NGIN_DISPATCH_API __declspec(dllexport)
    #else
      #define NGIN_DISPATCH_API __declspec(dllimport)
    #endif
  #endif
#else
  #if defined(NGIN_DISPATCH_EXPORTS)
    #define NGIN_DISPATCH_API __attribute__((visibility("default")))
  #else
    #define NGIN_DISPATCH_API
  #endif
#endif
