/**
 *
 *  @file composer.cpp
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
#include <corral/core/composer.hpp>
#include <corral/core/error.hpp>
#include <corral/core/error_slot.hpp>
#include <corral/detail/asserts.hpp>
#include <corral/detail/log.hpp>

#include <atomic>
#include <exception>
#include <thread>
#include <utility>

namespace corral::core
{
  namespace
  {
    void check_runners(const std::vector<runner_ptr> &runners)
    {
      for (const auto &r : runners)
      {
        if (!r)
          throw std::system_error(make_error_code(errc::invalid_argument),
                                  "composer: null runner");
      }
    }
  } // namespace

  composer::composer(std::vector<runner_ptr> runners)
      : runners_(std::move(runners))
  {
    check_runners(runners_);
  }

  composer::composer(std::vector<runner_ptr> runners, signal error_signal)
      : runners_(std::move(runners)),
        error_signal_(error_signal)
  {
    check_runners(runners_);
  }

  std::error_code composer::setup()
  {
    if (state_ == state::consumed)
      return make_error_code(errc::runner_consumed);

    if (state_ == state::setup_done)
      return {};

    if (state_ == state::setup_failed)
      return setup_error_;

    for (std::size_t i = 0; i < runners_.size(); ++i)
    {
      if (auto ec = runners_[i]->setup())
      {
        CORRAL_LOG_WARN("composer", corral::detail::concat("setup of runner #", i,
                                                   " failed: ", ec.message()));
        setup_error_ = ec;
        state_ = state::setup_failed;
        return ec;
      }
    }

    state_ = state::setup_done;
    return {};
  }

  std::error_code composer::run(signal_receiver signals)
  {
    if (state_ == state::consumed)
      return make_error_code(errc::runner_consumed);

    if (state_ == state::init || state_ == state::setup_failed)
    {
      if (auto ec = setup())
        return ec;
    }

    state_ = state::consumed;
    std::vector<runner_ptr> runners = std::move(runners_);
    runners_.clear();

    std::vector<signal_sender> outs;
    std::vector<signal_receiver> ins;
    outs.reserve(runners.size());
    ins.reserve(runners.size());
    for (std::size_t i = 0; i < runners.size(); ++i)
    {
      auto [tx, rx] = make_channel<signal>(detail::k_signal_buffer);
      outs.push_back(std::move(tx));
      ins.push_back(std::move(rx));
    }

    auto stop = make_channel<bool>(detail::k_stop_capacity);
    auto failures = make_channel<bool>(detail::k_failure_capacity);

    error_slot errors;
    fault_slot faults;
    std::atomic<bool> failure_raised{false};
    const bool propagate = error_signal_.has_value();

    // Wakes the fan-out thread once, for whichever failure is seen first.
    auto raise_failure = [&]()
    {
      if (!propagate || failure_raised.exchange(true))
        return;

      if (!failures.first.try_send(true))
        CORRAL_LOG_DEBUG("composer", "fan-out already gone, error signal not broadcast");
    };

    CORRAL_LOG_DEBUG("composer", corral::detail::concat("running ", runners.size(), " runners",
                                                propagate ? " (error propagation on)" : ""));

    std::thread signaling(
        [&faults,
         signals = std::move(signals),
         outs = std::move(outs),
         failed_rx = std::move(failures.second),
         stop_rx = std::move(stop.second),
         error_signal = error_signal_]() mutable
        {
          try
          {
            fan_out(std::move(signals), std::move(outs), std::move(failed_rx),
                    std::move(stop_rx), error_signal);
          }
          catch (...)
          {
            faults.try_set(std::current_exception());
          }
        });

    // Only call once every receiver left in ins is gone, so fan-out cannot be
    // stuck in a send when stop arrives. The child streams close with it.
    auto stop_fan_out = [&]()
    {
      if (!stop.first.send(true))
        CORRAL_LOG_DEBUG("composer", "fan-out exited before stop");
      signaling.join();
    };

    std::vector<std::thread> workers;
    try
    {
      workers.reserve(runners.size());
      for (std::size_t i = 0; i < runners.size(); ++i)
      {
        workers.emplace_back(
            [&errors, &faults, &raise_failure, i,
             r = std::move(runners[i]),
             rx = std::move(ins[i])]() mutable
            {
              try
              {
                std::error_code ec = r->run(std::move(rx));
                if (ec)
                {
                  if (errors.try_set(ec))
                    CORRAL_LOG_WARN("composer", corral::detail::concat("runner #", i,
                                                               " failed first: ", ec.message()));
                  else
                    CORRAL_LOG_DEBUG("composer", corral::detail::concat("runner #", i,
                                                                " failed after another runner: ", ec.message()));
                  raise_failure();
                }
              }
              catch (...)
              {
                CORRAL_LOG_ERROR("composer", corral::detail::concat("runner #", i, " threw"));
                faults.try_set(std::current_exception());
                raise_failure();
              }

              r.reset();
            });
      }
    }
    catch (...)
    {
      // Stopping fan-out closes every child stream, so started workers return.
      CORRAL_LOG_ERROR("composer", corral::detail::concat("could not start all ", runners.size(), " runners"));
      ins.clear();
      stop_fan_out();
      for (auto &w : workers)
        w.join();
      throw;
    }

    for (auto &w : workers)
      w.join();

    stop_fan_out();

    faults.rethrow_if_set();

    auto err = errors.take();
    return err ? *err : std::error_code{};
  }

  void composer::fan_out(signal_receiver signals,
                         std::vector<signal_sender> outs,
                         receiver<bool> failures,
                         receiver<bool> stop,
                         std::optional<signal> error_signal)
  {
    bool running = true;
    bool signals_open = true;
    bool failures_open = error_signal.has_value();

    // Runners that already returned dropped their receiver; send() skips them.
    auto broadcast = [&](signal sig)
    {
      std::size_t delivered = 0;
      for (auto &out : outs)
      {
        if (out.send(sig))
          ++delivered;
      }

      CORRAL_LOG_TRACE("composer", corral::detail::concat(sig, " delivered to ", delivered,
                                                          "/", outs.size(), " runners"));
    };

    while (running)
    {
      selector sel;

      sel.on(stop, [&](std::optional<bool>)
             { running = false; });

      if (failures_open)
      {
        sel.on(failures, [&](std::optional<bool> failed)
               {
                 if (!failed)
                 {
                   failures_open = false;
                   return;
                 }

                 CORRAL_ASSERT(error_signal.has_value());

                 CORRAL_LOG_INFO("composer", corral::detail::concat("broadcasting ", *error_signal,
                                                            " after runner failure"));
                 broadcast(*error_signal); });
      }

      if (signals_open)
      {
        sel.on(signals, [&](std::optional<signal> sig)
               {
                 if (!sig)
                 {
                   CORRAL_LOG_DEBUG("composer", "inbound signal stream closed");
                   signals_open = false;
                   return;
                 }

                 broadcast(*sig); });
      }

      sel.wait();
    }
  }

} // namespace corral::core
