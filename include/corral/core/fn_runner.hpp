/**
 *
 *  @file fn_runner.hpp
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
#ifndef CORRAL_FN_RUNNER_HPP
#define CORRAL_FN_RUNNER_HPP

#include <optional>
#include <system_error>
#include <type_traits>
#include <utility>

#include <corral/core/error.hpp>
#include <corral/core/runner.hpp>

namespace corral::core
{

  /**
   * @brief Runner built from a callable.
   *
   * setup() always succeeds. run() moves the callable out and invokes it
   * once; any later run() reports errc::runner_consumed.
   *
   * @tparam Fn Callable with signature std::error_code(signal_receiver).
   */
  template <typename Fn>
  class fn_runner final : public runner
  {
    static_assert(std::is_invocable_r_v<std::error_code, Fn &, signal_receiver>,
                  "fn_runner callable must be std::error_code(signal_receiver)");

  public:
    explicit fn_runner(Fn fn) : fn_(std::move(fn)) {}

    std::error_code setup() override { return {}; }

    std::error_code run(signal_receiver signals) override
    {
      if (!fn_)
        return make_error_code(errc::runner_consumed);

      Fn fn = std::move(*fn_);
      fn_.reset();
      return fn(std::move(signals));
    }

  private:
    std::optional<Fn> fn_;
  };

  template <typename Fn>
  runner_ptr make_fn_runner(Fn &&fn)
  {
    using D = std::decay_t<Fn>;
    return runner_ptr(new fn_runner<D>(D(std::forward<Fn>(fn))));
  }

} // namespace corral::core

#endif
