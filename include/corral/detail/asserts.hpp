/**
 *
 *  @file asserts.hpp
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
#ifndef CORRAL_ASSERTS_HPP
#define CORRAL_ASSERTS_HPP

#include <cstdlib>
#include <string>

#include <corral/detail/config.hpp>
#include <corral/detail/log.hpp>

namespace corral::detail
{

  // Routed through the logger so the failure is serialized with other output.
  [[noreturn]] inline void assert_fail(
      const char *expr,
      const char *file,
      int line,
      const char *msg = nullptr)
  {
    std::string text = concat("assertion failed: ", expr, " at ", file, ":", line);
    if (msg)
      text += concat(" (", msg, ")");

    log(log_level::fatal, "assert", text);
    std::abort();
  }

} // namespace corral::detail

#if CORRAL_ENABLE_ASSERTS
#define CORRAL_ASSERT(expr) \
  ((expr) ? (void)0 : ::corral::detail::assert_fail(#expr, __FILE__, __LINE__))

#define CORRAL_ASSERT_MSG(expr, msg) \
  ((expr) ? (void)0 : ::corral::detail::assert_fail(#expr, __FILE__, __LINE__, msg))
#else
#define CORRAL_ASSERT(expr) ((void)0)
#define CORRAL_ASSERT_MSG(expr, msg) ((void)0)
#endif

#endif
