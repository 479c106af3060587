/**
 *
 *  @file launch.cpp
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
#include <corral/core/launch.hpp>
#include <corral/core/error.hpp>
#include <corral/version.hpp>
#include <corral/detail/log.hpp>

#include <asio/error.hpp>

#include <utility>

namespace corral::core
{

  signal_subscription::signal_subscription(const std::vector<signal> &signals, signal_sender out)
      : signals_(signals),
        out_(std::move(out)),
        set_(ioc_)
  {
    for (signal sig : signals_)
    {
      const int native = to_native(sig);
      if (native < 0)
        throw std::system_error(make_error_code(errc::not_supported),
                                corral::detail::concat("cannot subscribe to ", sig));

      set_.add(native);
    }

    arm();

    guard_ = std::make_unique<guard_t>(asio::make_work_guard(ioc_));
    thread_ = std::thread(
        [this]()
        { ioc_.run(); });

    CORRAL_LOG_DEBUG("launch", corral::detail::concat("subscribed to ", signals_.size(), " signals"));
  }

  signal_subscription::~signal_subscription()
  {
    stop();
    if (thread_.joinable())
      thread_.join();
  }

  void signal_subscription::stop() noexcept
  {
    if (stopped_.exchange(true))
      return;

    if (guard_)
      guard_.reset();

    ioc_.stop();
  }

  void signal_subscription::arm()
  {
    set_.async_wait(
        [this](const std::error_code &ec, int signo)
        { on_signal(ec, signo); });
  }

  void signal_subscription::on_signal(const std::error_code &ec, int signo)
  {
    if (ec == asio::error::operation_aborted || stopped_)
      return;

    if (ec)
    {
      CORRAL_LOG_ERROR("launch", corral::detail::concat("signal wait failed: ", ec.message()));
      return;
    }

    if (auto sig = from_native(signo))
    {
      if (out_.try_send(*sig))
        delivered_.fetch_add(1, std::memory_order_relaxed);
      else
        CORRAL_LOG_WARN("launch", corral::detail::concat(*sig, " received but nobody is listening"));
    }
    else
    {
      CORRAL_LOG_WARN("launch", corral::detail::concat("ignoring unknown signal number ", signo));
    }

    arm();
  }

  std::unique_ptr<process> launch(runner_ptr r, const std::vector<signal> &signals)
  {
    auto chan = make_unbounded_channel<signal>();
    auto subscription = std::make_unique<signal_subscription>(signals, chan.first);

    CORRAL_LOG_INFO("launch", corral::detail::concat("starting supervised runner (corral ", corral::version_string, ")"));
    return std::make_unique<process>(std::move(r),
                                     std::move(chan.first),
                                     std::move(chan.second),
                                     std::move(subscription));
  }

} // namespace corral::core
