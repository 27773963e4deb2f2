#pragma once

#include <cstdio>

// Branch prediction hint
#define UNLIKELY(x) __builtin_expect(!!(x), 0)

// Cache line alignment
#define CACHE_LINE_SIZE 64

// CPU pause for spin loops
#if defined(__x86_64__) || defined(__i386__)
  #define CPU_PAUSE() __builtin_ia32_pause()
#else
  #define CPU_PAUSE() ((void)0)
#endif

#define COLD_FUNCTION __attribute__((cold))

// Fixed-buffer string copy that always terminates
#define SAFE_STRCPY(dst, src) \
    do { std::snprintf((dst), sizeof(dst), "%s", (src)); } while (0)
