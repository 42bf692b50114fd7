#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(OMEMO_SEND_PLUGIN_EXPORTS)
    #define OSP_API __declspec(dllexport)
  #else
    #define OSP_API __declspec(dllimport)
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define OSP_API __attribute__((visibility("default")))
#else
  #define OSP_API
#endif
