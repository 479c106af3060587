/**
 *
 *  @file signal.cpp
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
#include <corral/core/signal.hpp>
#include <corral/detail/config.hpp>

#include <array>
#include <csignal>

#if CORRAL_PLATFORM_UNIX
#include <signal.h>
#endif

namespace corral::core
{
  namespace
  {
    struct signal_entry
    {
      signal sig;
      std::string_view name;
      int native;
    };

#if CORRAL_PLATFORM_UNIX
#define CORRAL_NATIVE(x) x
#else
#define CORRAL_NATIVE(x) -1
#endif

#if CORRAL_PLATFORM_LINUX
#define CORRAL_NATIVE_LINUX(x) x
#else
#define CORRAL_NATIVE_LINUX(x) -1
#endif

    // SIGINT, SIGILL, SIGABRT, SIGFPE, SIGSEGV and SIGTERM are ISO C.
    constexpr std::array<signal_entry, 29> k_signals{{
        {signal::hangup, "SIGHUP", CORRAL_NATIVE(SIGHUP)},
        {signal::interrupt, "SIGINT", SIGINT},
        {signal::quit, "SIGQUIT", CORRAL_NATIVE(SIGQUIT)},
        {signal::illegal, "SIGILL", SIGILL},
        {signal::abort, "SIGABRT", SIGABRT},
        {signal::float_error, "SIGFPE", SIGFPE},
        {signal::kill, "SIGKILL", CORRAL_NATIVE(SIGKILL)},
        {signal::segfault, "SIGSEGV", SIGSEGV},
        {signal::pipe, "SIGPIPE", CORRAL_NATIVE(SIGPIPE)},
        {signal::alarm, "SIGALRM", CORRAL_NATIVE(SIGALRM)},
        {signal::terminate, "SIGTERM", SIGTERM},
        {signal::user1, "SIGUSR1", CORRAL_NATIVE(SIGUSR1)},
        {signal::user2, "SIGUSR2", CORRAL_NATIVE(SIGUSR2)},
        {signal::child, "SIGCHLD", CORRAL_NATIVE(SIGCHLD)},
        {signal::cont, "SIGCONT", CORRAL_NATIVE(SIGCONT)},
        {signal::stop, "SIGSTOP", CORRAL_NATIVE(SIGSTOP)},
        {signal::tstp, "SIGTSTP", CORRAL_NATIVE(SIGTSTP)},
        {signal::ttin, "SIGTTIN", CORRAL_NATIVE(SIGTTIN)},
        {signal::ttou, "SIGTTOU", CORRAL_NATIVE(SIGTTOU)},
        {signal::bus, "SIGBUS", CORRAL_NATIVE(SIGBUS)},
        {signal::prof, "SIGPROF", CORRAL_NATIVE(SIGPROF)},
        {signal::sys, "SIGSYS", CORRAL_NATIVE(SIGSYS)},
        {signal::trap, "SIGTRAP", CORRAL_NATIVE(SIGTRAP)},
        {signal::urg, "SIGURG", CORRAL_NATIVE(SIGURG)},
        {signal::vtalrm, "SIGVTALRM", CORRAL_NATIVE(SIGVTALRM)},
        {signal::xcpu, "SIGXCPU", CORRAL_NATIVE(SIGXCPU)},
        {signal::xfsz, "SIGXFSZ", CORRAL_NATIVE(SIGXFSZ)},
        {signal::io, "SIGIO", CORRAL_NATIVE_LINUX(SIGIO)},
        {signal::winch, "SIGWINCH", CORRAL_NATIVE(SIGWINCH)},
    }};

#undef CORRAL_NATIVE
#undef CORRAL_NATIVE_LINUX

    const signal_entry *find(signal sig) noexcept
    {
      const auto idx = static_cast<std::size_t>(sig);
      if (idx < k_signals.size() && k_signals[idx].sig == sig)
        return &k_signals[idx];
      return nullptr;
    }
  } // namespace

  std::string_view to_string(signal sig) noexcept
  {
    const auto *e = find(sig);
    return e ? e->name : std::string_view{"SIG?"};
  }

  int to_native(signal sig) noexcept
  {
    const auto *e = find(sig);
    return e ? e->native : -1;
  }

  std::optional<signal> from_native(int signo) noexcept
  {
    if (signo < 0)
      return std::nullopt;

    for (const auto &e : k_signals)
    {
      if (e.native == signo)
        return e.sig;
    }
    return std::nullopt;
  }

} // namespace corral::core
