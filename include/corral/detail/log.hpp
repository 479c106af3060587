/**
 *
 *  @file log.hpp
 *  @author Gaspard Kirira
 *
 *  Copyright 2025, Gaspard Kirira.  All rights reserved.
 *  https://github.com/vixcpp/vix
 *  Use of this source code is governed by a MIT license
 *  that can be found in the License file.
 *
 *  Vix.cpp
 *
 */
#ifndef CORRAL_LOG_HPP
#define CORRAL_LOG_HPP

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <corral/detail/config.hpp>

namespace corral::detail
{
  enum class log_level : int
  {
    trace = 0,
    debug,
    info,
    warn,
    error,
    fatal,
    off
  };

  inline std::atomic<log_level> g_log_level{
      static_cast<log_level>(CORRAL_DEFAULT_LOG_LEVEL)};
  inline std::mutex g_log_mutex;

  inline const char *to_string(log_level lvl)
  {
    switch (lvl)
    {
    case log_level::trace:
      return "TRACE";
    case log_level::debug:
      return "DEBUG";
    case log_level::info:
      return "INFO";
    case log_level::warn:
      return "WARN";
    case log_level::error:
      return "ERROR";
    case log_level::fatal:
      return "FATAL";
    default:
      return "OFF";
    }
  }

  inline void set_log_level(log_level lvl) noexcept
  {
    g_log_level.store(lvl, std::memory_order_relaxed);
  }

  inline log_level get_log_level() noexcept
  {
    return g_log_level.load(std::memory_order_relaxed);
  }

  inline bool log_enabled(log_level lvl) noexcept
  {
    return lvl >= get_log_level() && lvl != log_level::off;
  }

  /**
   * @brief Stream every argument into one string.
   *
   * Lets call sites log values without building the message by hand:
   * CORRAL_LOG_DEBUG(detail::concat("spawning ", n, " runners")).
   */
  template <typename... Args>
  std::string concat(Args &&...args)
  {
    std::ostringstream os;
    (os << ... << std::forward<Args>(args));
    return os.str();
  }

  // ================================
  // Core log function
  // ================================
  inline void log(log_level lvl, std::string_view component, std::string_view msg)
  {
    if (!log_enabled(lvl) && lvl != log_level::fatal)
      return;

    {
      std::lock_guard<std::mutex> lock(g_log_mutex);

      auto now = std::chrono::system_clock::now();
      std::time_t t = std::chrono::system_clock::to_time_t(now);

      std::tm tm{};
#if defined(_WIN32)
      localtime_s(&tm, &t);
#else
      localtime_r(&t, &tm);
#endif

      char buf[32];
      std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);

      std::cerr << "[" << buf << "] "
                << "[" << to_string(lvl) << "] "
                << "[" << component << "] "
                << "[tid " << std::this_thread::get_id() << "] "
                << msg << "\n";
    }

    // fatal is reserved for faults that can no longer be reported to a caller
    if (lvl == log_level::fatal)
      std::abort();
  }

#define CORRAL_LOG_TRACE(component, msg) ::corral::detail::log(::corral::detail::log_level::trace, component, msg)
#define CORRAL_LOG_DEBUG(component, msg) ::corral::detail::log(::corral::detail::log_level::debug, component, msg)
#define CORRAL_LOG_INFO(component, msg) ::corral::detail::log(::corral::detail::log_level::info, component, msg)
#define CORRAL_LOG_WARN(component, msg) ::corral::detail::log(::corral::detail::log_level::warn, component, msg)
#define CORRAL_LOG_ERROR(component, msg) ::corral::detail::log(::corral::detail::log_level::error, component, msg)
#define CORRAL_LOG_FATAL(component, msg) ::corral::detail::log(::corral::detail::log_level::fatal, component, msg)

} // namespace corral::detail

#endif
