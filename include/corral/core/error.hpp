/**
 *
 *  @file error.hpp
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
#ifndef CORRAL_ERROR_HPP
#define CORRAL_ERROR_HPP

#include <cstdint>
#include <string>
#include <system_error>

namespace corral::core
{

  /**
   * @brief Errors raised by the supervision core itself.
   *
   * Failures reported by runners keep their own category and reach the
   * caller untouched; use is_runner_error() to tell the two apart.
   */
  enum class errc : std::uint8_t
  {
    ok = 0,

    // Generic
    invalid_argument,

    // Process lifecycle
    result_already_given,
    could_not_recv_result,

    // Runner lifecycle
    runner_consumed,

    // Channels / signals
    closed,
    not_supported
  };

  class error_category final : public std::error_category
  {
  public:
    const char *name() const noexcept override
    {
      return "corral";
    }

    std::string message(int c) const override
    {
      switch (static_cast<errc>(c))
      {
      case errc::ok:
        return "ok";
      case errc::invalid_argument:
        return "invalid argument";
      case errc::result_already_given:
        return "result already returned to caller";
      case errc::could_not_recv_result:
        return "could not receive result from thread";
      case errc::runner_consumed:
        return "runner already consumed by run";
      case errc::closed:
        return "closed";
      case errc::not_supported:
        return "not supported";
      default:
        return "unknown error";
      }
    }
  };

  inline const std::error_category &category() noexcept
  {
    static error_category cat;
    return cat;
  }

  inline std::error_code make_error_code(errc e) noexcept
  {
    return {static_cast<int>(e), category()};
  }

  // A failure that came out of a runner's setup or run.
  inline bool is_runner_error(const std::error_code &ec) noexcept
  {
    return ec && ec.category() != category();
  }

} // namespace corral::core

namespace std
{
  template <>
  struct is_error_code_enum<corral::core::errc> : true_type
  {
  };
} // namespace std

#endif
