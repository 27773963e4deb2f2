#pragma once

#include <cstring>
#include <pthread.h>
#include <thread>
#include <utility>

namespace Common {

/// Name the calling thread for ps/top/gdb. Linux limits names to 15 chars.
inline auto setThreadName(const char* name) noexcept -> bool {
  char truncated_name[16];
  strncpy(truncated_name, name, 15);
  truncated_name[15] = '\0';
  return pthread_setname_np(pthread_self(), truncated_name) == 0;
}

/// Start a named worker thread running func(args...).
template<typename T, typename... A>
inline auto createNamedThread(const char* name, T&& func, A&&... args) -> std::thread {
  return std::thread([name, func = std::forward<T>(func),
                      ...args = std::forward<A>(args)]() mutable {
    setThreadName(name);
    std::move(func)(std::move(args)...);
  });
}

} // namespace Common
