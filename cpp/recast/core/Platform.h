#ifndef _IN_RECAST_CORE_PLATFORM_H
#define _IN_RECAST_CORE_PLATFORM_H

#ifdef WIN32
#define NOMINMAX
#include <windows.h>

#define NO_INLINE   __declspec(noinline)

#define likely(x)   x
#define unlikely(x) x

#else

#define NO_INLINE   __attribute__ ((noinline))

#define likely(x)   __builtin_expect ( (x), 1 )
#define unlikely(x) __builtin_expect ( (x), 0 )

#endif

#endif
