/**
 *
 *  @file runner.hpp
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
#ifndef CORRAL_RUNNER_HPP
#define CORRAL_RUNNER_HPP

#include <memory>
#include <system_error>

#include <corral/core/signal.hpp>

namespace corral::core
{

  /**
   * @brief A unit of work that runs until told to stop.
   *
   * Lifecycle:
   * - setup() is called at most once and must return in finite time.
   * - run() is called at most once, and only after setup() succeeded.
   *   It must return in finite time after receiving the signal the runner
   *   treats as shutdown.
   * - The owner destroys the runner once run() returned.
   *
   * An empty std::error_code means success. Runners report failures in
   * their own std::error_category. An exception escaping setup() or run()
   * is a fault: the supervisor rethrows it when the thread is joined.
   *
   * signals.recv() returning std::nullopt means no further signal will
   * arrive. A runner may keep working or treat it as shutdown.
   */
  class runner
  {
  public:
    virtual ~runner() = default;

    virtual std::error_code setup() = 0;
    virtual std::error_code run(signal_receiver signals) = 0;
  };

  using runner_ptr = std::unique_ptr<runner>;

} // namespace corral::core

#endif
