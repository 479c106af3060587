/**
 *
 *  @file config.hpp
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
#ifndef CORRAL_CONFIG_HPP
#define CORRAL_CONFIG_HPP

#ifndef CORRAL_VERSION_MAJOR
#define CORRAL_VERSION_MAJOR 0
#endif

#ifndef CORRAL_VERSION_MINOR
#define CORRAL_VERSION_MINOR 3
#endif

#ifndef CORRAL_VERSION_PATCH
#define CORRAL_VERSION_PATCH 0
#endif

#define CORRAL_VERSION_STRING "0.3.0"

#ifndef CORRAL_ENABLE_ASSERTS
#ifndef NDEBUG
#define CORRAL_ENABLE_ASSERTS 1
#else
#define CORRAL_ENABLE_ASSERTS 0
#endif
#endif

// Initial value of the runtime log level (see detail/log.hpp).
// 0 = trace ... 5 = fatal, 6 = off
#ifndef CORRAL_DEFAULT_LOG_LEVEL
#ifndef NDEBUG
#define CORRAL_DEFAULT_LOG_LEVEL 2
#else
#define CORRAL_DEFAULT_LOG_LEVEL 3
#endif
#endif

// Platform detection
#if defined(_WIN32)
#define CORRAL_PLATFORM_WINDOWS 1
#else
#define CORRAL_PLATFORM_WINDOWS 0
#endif

#if defined(__linux__)
#define CORRAL_PLATFORM_LINUX 1
#else
#define CORRAL_PLATFORM_LINUX 0
#endif

#if defined(__unix__) || defined(__APPLE__)
#define CORRAL_PLATFORM_UNIX 1
#else
#define CORRAL_PLATFORM_UNIX 0
#endif

#if defined(_WIN32)
#define CORRAL_EXPORT __declspec(dllexport)
#define CORRAL_IMPORT __declspec(dllimport)
#else
#define CORRAL_EXPORT __attribute__((visibility("default")))
#define CORRAL_IMPORT
#endif

#endif
