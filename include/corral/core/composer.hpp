/**
 *
 *  @file composer.hpp
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
#ifndef CORRAL_COMPOSER_HPP
#define CORRAL_COMPOSER_HPP

#include <cstddef>
#include <optional>
#include <system_error>
#include <vector>

#include <corral/core/channel.hpp>
#include <corral/core/runner.hpp>
#include <corral/core/signal.hpp>

namespace corral::core
{
  namespace detail
  {
    // Per-runner inbound buffer; absorbs signal bursts without stalling fan-out.
    inline constexpr std::size_t k_signal_buffer = 1024;

    // Stop instruction for the fan-out thread (rendezvous).
    inline constexpr std::size_t k_stop_capacity = 0;

    inline constexpr std::size_t k_failure_capacity = 4;
  } // namespace detail

  /**
   * @brief Runs a fixed set of runners concurrently as one runner.
   *
   * run() spawns one thread per child plus one fan-out thread. The fan-out
   * thread copies every inbound signal to each child's private channel in
   * arrival order. The first child failure becomes the composer's result;
   * failures reported after it are discarded.
   *
   * Built with an error signal, the composer also broadcasts that signal to
   * every child as soon as the first failure (or fault) is captured, so the
   * survivors can shut down without waiting for an external signal.
   *
   * An exception escaping a child's run() is rethrown from run() once every
   * thread has been joined.
   *
   * Composers are runners, so they nest.
   */
  class composer final : public runner
  {
  public:
    explicit composer(std::vector<runner_ptr> runners);
    composer(std::vector<runner_ptr> runners, signal error_signal);

    composer(const composer &) = delete;
    composer &operator=(const composer &) = delete;

    /**
     * @brief Set up every child in order.
     *
     * Stops at the first failure and returns it; later children are not set
     * up. Calling it again after success does nothing. After a failure every
     * later setup() or run() returns that same error without touching the
     * children again.
     */
    std::error_code setup() override;

    /**
     * @brief Run every child until all of them returned.
     *
     * Performs setup() first if it was not called. The composer is consumed:
     * a second call returns errc::runner_consumed.
     */
    std::error_code run(signal_receiver signals) override;

    std::size_t size() const noexcept { return runners_.size(); }

    std::optional<signal> error_signal() const noexcept { return error_signal_; }

    bool propagates_errors() const noexcept { return error_signal_.has_value(); }

  private:
    enum class state
    {
      init,
      setup_done,
      setup_failed,
      consumed
    };

    static void fan_out(signal_receiver signals,
                        std::vector<signal_sender> outs,
                        receiver<bool> failures,
                        receiver<bool> stop,
                        std::optional<signal> error_signal);

  private:
    std::vector<runner_ptr> runners_;
    std::optional<signal> error_signal_{};
    state state_{state::init};
    std::error_code setup_error_{};
  };

} // namespace corral::core

#endif
