#pragma once

#if defined(_WIN32)
#  if defined(CRASHRELAY_BUILD_SHARED)
#    if defined(crashrelay_core_EXPORTS)
#      define CRASHRELAY_API __declspec(dllexport)
#    else
#      define CRASHRELAY_API __declspec(dllimport)
#    endif
#  else
#    define CRASHRELAY_API
#  endif
#else
#  if defined(CRASHRELAY_BUILD_SHARED)
#    define CRASHRELAY_API __attribute__((visibility("default")))
#  else
#    define CRASHRELAY_API
#  endif
#endif
