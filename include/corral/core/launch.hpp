/**
 *
 *  @file launch.hpp
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
#ifndef CORRAL_LAUNCH_HPP
#define CORRAL_LAUNCH_HPP

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <system_error>
#include <thread>
#include <vector>

#include <corral/core/process.hpp>
#include <corral/core/runner.hpp>
#include <corral/core/signal.hpp>

namespace corral::core
{

  /**
   * @brief Forwards OS signal deliveries into a signal channel.
   *
   * Owns a private asio io_context driven by one thread. Each delivery of a
   * subscribed OS signal is pushed into the sender given at construction.
   * Subscribing to a signal the platform lacks throws std::system_error
   * (errc::not_supported); asio reports registration failures the same way.
   */
  class signal_subscription
  {
  public:
    using guard_t = asio::executor_work_guard<asio::io_context::executor_type>;

    signal_subscription(const std::vector<signal> &signals, signal_sender out);
    ~signal_subscription();

    signal_subscription(const signal_subscription &) = delete;
    signal_subscription &operator=(const signal_subscription &) = delete;

    void stop() noexcept;

    const std::vector<signal> &signals() const noexcept { return signals_; }

    // Number of OS deliveries forwarded so far.
    std::size_t delivered() const noexcept { return delivered_.load(std::memory_order_relaxed); }

  private:
    void arm();
    void on_signal(const std::error_code &ec, int signo);

  private:
    std::vector<signal> signals_;
    signal_sender out_;

    asio::io_context ioc_;
    asio::signal_set set_;
    std::unique_ptr<guard_t> guard_;
    std::thread thread_;

    std::atomic<std::size_t> delivered_{0};
    std::atomic_bool stopped_{false};
  };

  /**
   * @brief Subscribe to @p signals and start @p r under a process.
   *
   * OS deliveries of the subscribed signals and process::signal() feed the
   * same stream. Call this before the program starts any other thread, so
   * that no thread created earlier can observe the subscribed signals
   * before the subscription does; the behavior otherwise depends on the
   * platform and is not reported.
   */
  std::unique_ptr<process> launch(runner_ptr r, const std::vector<signal> &signals);

} // namespace corral::core

#endif
