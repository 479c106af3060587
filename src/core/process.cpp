/**
 *
 *  @file process.cpp
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
#include <corral/core/process.hpp>
#include <corral/core/error.hpp>
#include <corral/core/launch.hpp>
#include <corral/detail/asserts.hpp>
#include <corral/detail/log.hpp>

#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace corral::core
{
  namespace
  {
    // Result slots hold exactly one value each.
    constexpr std::size_t k_result_capacity = 1;

    std::string describe(const std::exception_ptr &ex)
    {
      try
      {
        std::rethrow_exception(ex);
      }
      catch (const std::exception &e)
      {
        return e.what();
      }
      catch (...)
      {
        return "non-standard exception";
      }
    }
  } // namespace

  std::string_view to_string(proc_state st) noexcept
  {
    switch (st)
    {
    case proc_state::init:
      return "init";
    case proc_state::setup_done:
      return "setup_done";
    case proc_state::finished:
      return "finished";
    default:
      return "unknown";
    }
  }

  namespace detail
  {
    std::error_code transition(std::atomic<proc_state> &state, proc_op op) noexcept
    {
      proc_state cur = state.load(std::memory_order_acquire);

      while (true)
      {
        proc_state next{};
        if (op == proc_op::ready && cur == proc_state::init)
          next = proc_state::setup_done;
        else if (op == proc_op::wait && cur != proc_state::finished)
          next = proc_state::finished;
        else
          return make_error_code(errc::result_already_given);

        if (state.compare_exchange_weak(cur, next, std::memory_order_acq_rel))
          return {};
      }
    }
  } // namespace detail

  process::process(runner_ptr r, signal_sender signaler, signal_receiver signals)
      : process(std::move(r), std::move(signaler), std::move(signals), nullptr)
  {
  }

  process::process(runner_ptr r,
                   signal_sender signaler,
                   signal_receiver signals,
                   std::unique_ptr<signal_subscription> subscription)
      : subscription_(std::move(subscription)),
        signaler_(std::move(signaler))
  {
    if (!r)
      throw std::system_error(make_error_code(errc::invalid_argument),
                              "process: null runner");

    auto setup_chan = make_channel<std::error_code>(k_result_capacity);
    auto run_chan = make_channel<std::error_code>(k_result_capacity);
    setup_result_ = std::move(setup_chan.second);
    run_result_ = std::move(run_chan.second);

    thread_ = std::thread(&process::lifecycle,
                          std::move(r),
                          std::move(signals),
                          std::move(setup_chan.first),
                          std::move(run_chan.first),
                          std::ref(faults_));
  }

  process::~process()
  {
    {
      std::lock_guard<std::mutex> lock(join_m_);
      if (thread_.joinable())
        thread_.join();
      joined_.store(true, std::memory_order_release);
    }

    // A destructor cannot rethrow; an unobserved fault must not vanish.
    if (auto ex = faults_.take())
      CORRAL_LOG_FATAL("process", corral::detail::concat("runner thread faulted: ", describe(*ex)));
  }

  void process::lifecycle(runner_ptr r,
                          signal_receiver signals,
                          sender<std::error_code> setup_result,
                          sender<std::error_code> run_result,
                          fault_slot &faults)
  {
    CORRAL_ASSERT_MSG(r != nullptr, "process thread started without a runner");

    try
    {
      std::error_code ec = r->setup();
      if (!setup_result.send(ec))
        CORRAL_LOG_DEBUG("process", "setup result dropped, nobody is listening");

      if (ec)
      {
        CORRAL_LOG_WARN("process", corral::detail::concat("setup failed: ", ec.message()));
        if (!run_result.send(ec))
          CORRAL_LOG_DEBUG("process", "run result dropped, nobody is listening");
        return;
      }

      ec = r->run(std::move(signals));
      r.reset();

      CORRAL_LOG_DEBUG("process", corral::detail::concat("runner returned: ",
                                                         ec ? ec.message() : std::string("ok")));
      if (!run_result.send(ec))
        CORRAL_LOG_DEBUG("process", "run result dropped, nobody is listening");
    }
    catch (...)
    {
      // The result senders close with this thread: ready()/wait() report
      // could_not_recv_result and join() rethrows.
      faults.try_set(std::current_exception());
    }
  }

  std::error_code process::take_result(receiver<std::error_code> &rx, std::string_view what)
  {
    auto res = rx.recv();
    if (!res)
    {
      CORRAL_LOG_ERROR("process", corral::detail::concat(what, " result channel closed before a value was published"));
      return make_error_code(errc::could_not_recv_result);
    }
    return *res;
  }

  std::error_code process::ready()
  {
    if (auto ec = detail::transition(state_, detail::proc_op::ready))
      return ec;

    return take_result(setup_result_, "setup");
  }

  std::error_code process::wait()
  {
    if (auto ec = detail::transition(state_, detail::proc_op::wait))
      return ec;

    return take_result(run_result_, "run");
  }

  bool process::signal(core::signal sig)
  {
    if (signaler_.try_send(sig))
      return true;

    CORRAL_LOG_DEBUG("process", corral::detail::concat(sig, " not delivered, runner is not accepting signals"));
    return false;
  }

  void process::join()
  {
    {
      std::lock_guard<std::mutex> lock(join_m_);
      if (thread_.joinable())
        thread_.join();
      joined_.store(true, std::memory_order_release);
    }

    faults_.rethrow_if_set();
  }

} // namespace corral::core
