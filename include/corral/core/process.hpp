/**
 *
 *  @file process.hpp
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
#ifndef CORRAL_PROCESS_HPP
#define CORRAL_PROCESS_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <system_error>
#include <thread>

#include <corral/core/channel.hpp>
#include <corral/core/error_slot.hpp>
#include <corral/core/runner.hpp>
#include <corral/core/signal.hpp>

namespace corral::core
{
  class signal_subscription;

  /**
   * @brief Handle on a running unit of work: wait for it, signal it.
   */
  class supervisor
  {
  public:
    virtual ~supervisor() = default;

    /**
     * @brief Block until setup finished and return its outcome.
     */
    virtual std::error_code ready() = 0;

    /**
     * @brief Block until the work finished and return its outcome.
     */
    virtual std::error_code wait() = 0;

    /**
     * @brief Deliver a signal to the running work. Never blocks.
     *
     * @return false if the signal could not be queued.
     */
    virtual bool signal(core::signal sig) = 0;
  };

  enum class proc_state : std::uint8_t
  {
    init,
    setup_done,
    finished
  };

  std::string_view to_string(proc_state st) noexcept;

  namespace detail
  {
    enum class proc_op : std::uint8_t
    {
      ready,
      wait
    };

    /**
     * @brief Advance the one-shot lifecycle guard for @p op.
     *
     * ready: init -> setup_done. wait: init | setup_done -> finished.
     * Any other starting state leaves @p state untouched and yields
     * errc::result_already_given.
     */
    std::error_code transition(std::atomic<proc_state> &state, proc_op op) noexcept;
  } // namespace detail

  /**
   * @brief Runs one runner on a dedicated thread.
   *
   * The constructor spawns the thread right away; it calls setup(), publishes
   * the outcome, then, only if setup succeeded, calls run() and publishes that
   * outcome too. If setup failed, its error is also what wait() returns.
   *
   * ready() and wait() each hand out their result once; later calls return
   * errc::result_already_given without blocking. wait() may be called
   * without ready(). signal() may be called any time, from any thread.
   *
   * Teardown: join() (or the destructor) joins the thread. An exception that
   * escaped the runner is rethrown by join(). If the process is destroyed
   * with such a fault never observed, the fault is logged as fatal.
   */
  class process final : public supervisor
  {
  public:
    process(runner_ptr r, signal_sender signaler, signal_receiver signals);

    // The process keeps @p subscription alive for as long as the runner runs.
    process(runner_ptr r,
            signal_sender signaler,
            signal_receiver signals,
            std::unique_ptr<signal_subscription> subscription);

    ~process() override;

    process(const process &) = delete;
    process &operator=(const process &) = delete;

    std::error_code ready() override;
    std::error_code wait() override;
    bool signal(core::signal sig) override;

    /**
     * @brief Join the runner thread and rethrow a fault raised on it.
     *
     * Blocks until the runner returned. Safe to call more than once.
     */
    void join();

    // Safe to call while another thread is inside join().
    bool joinable() const noexcept { return !joined_.load(std::memory_order_acquire); }

    proc_state state() const noexcept { return state_.load(std::memory_order_acquire); }

  private:
    static void lifecycle(runner_ptr r,
                          signal_receiver signals,
                          sender<std::error_code> setup_result,
                          sender<std::error_code> run_result,
                          fault_slot &faults);

    std::error_code take_result(receiver<std::error_code> &rx, std::string_view what);

  private:
    std::unique_ptr<signal_subscription> subscription_;
    signal_sender signaler_;

    receiver<std::error_code> setup_result_;
    receiver<std::error_code> run_result_;

    std::atomic<proc_state> state_{proc_state::init};
    fault_slot faults_;

    std::mutex join_m_;
    std::atomic<bool> joined_{false};
    std::thread thread_;
  };

} // namespace corral::core

#endif
