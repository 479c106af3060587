/**
 *
 *  @file signal.hpp
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
#ifndef CORRAL_SIGNAL_HPP
#define CORRAL_SIGNAL_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

#include <corral/core/channel.hpp>

namespace corral::core
{

  /**
   * @brief External event delivered to runners.
   *
   * Values mirror the POSIX signal set. The core never interprets them:
   * each runner decides which ones mean shutdown.
   */
  enum class signal : std::uint8_t
  {
    hangup,
    interrupt,
    quit,
    illegal,
    abort,
    float_error,
    kill,
    segfault,
    pipe,
    alarm,
    terminate,
    user1,
    user2,
    child,
    cont,
    stop,
    tstp,
    ttin,
    ttou,
    bus,
    prof,
    sys,
    trap,
    urg,
    vtalrm,
    xcpu,
    xfsz,
    io,
    winch
  };

  using signal_sender = sender<signal>;
  using signal_receiver = receiver<signal>;

  // "SIGINT", "SIGHUP", ...
  std::string_view to_string(signal sig) noexcept;

  // OS signal number, or -1 when the platform has no such signal.
  int to_native(signal sig) noexcept;

  std::optional<signal> from_native(int signo) noexcept;

  inline std::ostream &operator<<(std::ostream &os, signal sig)
  {
    return os << to_string(sig);
  }

} // namespace corral::core

#endif
