/**
 *
 *  @file version.hpp
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
#ifndef CORRAL_VERSION_HPP
#define CORRAL_VERSION_HPP

#include <corral/detail/config.hpp>

namespace corral
{

  inline constexpr int version_major = CORRAL_VERSION_MAJOR;
  inline constexpr int version_minor = CORRAL_VERSION_MINOR;
  inline constexpr int version_patch = CORRAL_VERSION_PATCH;

  // "0.3.0"
  inline constexpr const char *version_string = CORRAL_VERSION_STRING;

  // Bumped whenever runner or process vtables change layout.
  inline constexpr int abi_version = 1;

} // namespace corral

#endif
