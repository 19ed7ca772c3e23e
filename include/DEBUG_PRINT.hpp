// Just for debugging ;)
#ifndef DEBUG_PRINT_HPP
#define DEBUG_PRINT_HPP

#include <cstdint>
#include <cstdio>

extern "C" uint32_t brainrt_port_millis(void);

namespace brainrt::debug
{
   enum class Channel
   {
      Executor,
      Port,
      Task,
      Registry,
      Local,
      Test
   };

#if DEBUG_PRINT_ENABLE
   // Simple ANSI colour table
   inline const char* color(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Executor: return "\x1b[36m"; // cyan
         case Channel::Port:     return "\x1b[35m"; // magenta
         case Channel::Task:     return "\x1b[34m"; // blue
         case Channel::Registry: return "\x1b[33m"; // yellow
         case Channel::Local:    return "\x1b[31m"; // red
         case Channel::Test:     return "\x1b[32m"; // green
      }
      return "\x1b[0m";
   }

   inline const char* label(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Executor: return "EXEC  ";
         case Channel::Port:     return "PORT  ";
         case Channel::Task:     return "TASK  ";
         case Channel::Registry: return "REGIST";
         case Channel::Local:    return "LOCAL ";
         case Channel::Test:     return "TEST  ";
      }
      return "????";
   }

   inline constexpr const char* reset() noexcept { return "\x1b[0m"; }

   template <typename... Args>
   inline void print(Channel ch, const char* fmt, Args... args)
   {
      // prefix with millis + channel label
      std::printf("%s[ms=%07u][%s] ",
                  color(ch),
                  brainrt_port_millis(),
                  label(ch));
      if constexpr (sizeof...(args) == 0) std::printf("%s", fmt);
      else std::printf(fmt, args...);
      std::printf("%s\n", reset());
   }

#endif

}

// Convenience macros
#if DEBUG_PRINT_ENABLE
#  define LOG_EXEC(fmt, ...)        brainrt::debug::print(brainrt::debug::Channel::Executor, fmt, ##__VA_ARGS__)
#  define LOG_PORT(fmt, ...)        brainrt::debug::print(brainrt::debug::Channel::Port,     fmt, ##__VA_ARGS__)
#  define LOG_TASK(fmt, ...)        brainrt::debug::print(brainrt::debug::Channel::Task,     fmt, ##__VA_ARGS__)
#  define LOG_REGISTRY(fmt, ...)    brainrt::debug::print(brainrt::debug::Channel::Registry, fmt, ##__VA_ARGS__)
#  define LOG_LOCAL(fmt, ...)       brainrt::debug::print(brainrt::debug::Channel::Local,    fmt, ##__VA_ARGS__)
#  define LOG_TEST(fmt, ...)        brainrt::debug::print(brainrt::debug::Channel::Test,     fmt, ##__VA_ARGS__)
#else
#  define LOG_EXEC(...)     ((void)0)
#  define LOG_PORT(...)     ((void)0)
#  define LOG_TASK(...)     ((void)0)
#  define LOG_REGISTRY(...) ((void)0)
#  define LOG_LOCAL(...)    ((void)0)
#  define LOG_TEST(...)     ((void)0)

#endif

#endif
