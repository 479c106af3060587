/**
 *
 *  @file process_smoke_test.cpp
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
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <corral/core/composer.hpp>
#include <corral/core/error.hpp>
#include <corral/core/fn_runner.hpp>
#include <corral/core/process.hpp>

#include "test_runner.hpp"

namespace core = corral::core;

using core::composer;
using core::errc;
using core::make_channel;
using core::make_fn_runner;
using core::proc_state;
using core::process;
using core::runner_ptr;
using core::signal_receiver;
using corral_test::record_until;
using corral_test::setup_recorder;
using corral_test::signal_log;
using corral_test::test_errc;
using corral_test::test_runner;

namespace
{
  // setup() fails; run() must never be reached.
  class refusing_runner final : public core::runner
  {
  public:
    explicit refusing_runner(std::shared_ptr<std::atomic<bool>> ran) : ran_(std::move(ran)) {}

    std::error_code setup() override
    {
      return corral_test::make_error_code(test_errc::setup_refused);
    }

    std::error_code run(signal_receiver) override
    {
      ran_->store(true);
      return {};
    }

  private:
    std::shared_ptr<std::atomic<bool>> ran_;
  };
}

static void test_ready_process()
{
  auto [sn, rc] = make_channel<bool>(0);
  auto [signal_sn, signal_rc] = make_channel<core::signal>(9);

  process proc(std::make_unique<test_runner>(0, sn), signal_sn, signal_rc);
  assert(!proc.ready());
  assert(proc.state() == proc_state::setup_done);

  // Second call neither blocks nor re-runs setup.
  assert(proc.ready() == errc::result_already_given);

  assert(proc.signal(core::signal::interrupt));
  assert(*rc.recv());
  assert(!proc.wait());
  assert(proc.state() == proc_state::finished);
}

static void test_second_ready_never_reruns_setup()
{
  auto order = std::make_shared<std::vector<std::size_t>>();
  auto [signal_sn, signal_rc] = make_channel<core::signal>(1);

  process proc(std::make_unique<setup_recorder>(7, order, false), signal_sn, signal_rc);
  assert(!proc.ready());
  assert(proc.ready() == errc::result_already_given);
  assert(!proc.wait());
  proc.join();

  assert((*order == std::vector<std::size_t>{7}));
}

static void test_wait_and_signal_process()
{
  auto [sn, rc] = make_channel<bool>(0);
  auto [signal_sn, signal_rc] = make_channel<core::signal>(9);

  process proc(std::make_unique<test_runner>(0, sn), signal_sn, signal_rc);
  assert(proc.signal(core::signal::interrupt));

  assert(*rc.recv()); // rendezvous goes first
  assert(!proc.wait());
  assert(proc.wait() == errc::result_already_given);

  // wait() skipped ready(); ready() is no longer valid either.
  assert(proc.ready() == errc::result_already_given);
}

static void test_runner_error_surfaces()
{
  auto [sn, rc] = make_channel<bool>(0);
  auto [signal_sn, signal_rc] = make_channel<core::signal>(9);

  process proc(std::make_unique<test_runner>(0, sn), signal_sn, signal_rc);
  assert(!proc.ready());
  assert(proc.signal(core::signal::hangup));
  assert(!*rc.recv());

  auto res = proc.wait();
  assert(res == test_errc::picky_signal);
  assert(core::is_runner_error(res));
}

static void test_setup_failure_short_circuits_run()
{
  auto ran = std::make_shared<std::atomic<bool>>(false);
  auto [signal_sn, signal_rc] = make_channel<core::signal>(1);

  process proc(std::make_unique<refusing_runner>(ran), signal_sn, signal_rc);
  assert(proc.ready() == test_errc::setup_refused);
  assert(proc.wait() == test_errc::setup_refused);
  proc.join();
  assert(!ran->load());
}

static void test_wait_without_ready_after_setup_failure()
{
  auto ran = std::make_shared<std::atomic<bool>>(false);
  auto [signal_sn, signal_rc] = make_channel<core::signal>(1);

  process proc(std::make_unique<refusing_runner>(ran), signal_sn, signal_rc);
  assert(proc.wait() == test_errc::setup_refused);
  assert(!ran->load());
}

static void test_drop_joins_thread()
{
  auto returned = std::make_shared<std::atomic<bool>>(false);
  auto [signal_sn, signal_rc] = make_channel<core::signal>(1);

  {
    process proc(make_fn_runner([returned](signal_receiver signals) -> std::error_code
                                {
                                  auto sig = signals.recv();
                                  (void)sig;
                                  // Long enough that only a join can make the flag visible.
                                  std::this_thread::sleep_for(std::chrono::milliseconds(50));
                                  returned->store(true);
                                  return {}; }),
                 signal_sn, signal_rc);

    assert(proc.signal(core::signal::terminate));
    // Neither ready() nor wait() is called.
  }

  assert(returned->load());
}

static void test_fault_reported_by_join()
{
  auto [signal_sn, signal_rc] = make_channel<core::signal>(1);

  process proc(make_fn_runner([](signal_receiver signals) -> std::error_code
                              {
                                auto sig = signals.recv();
                                (void)sig;
                                throw std::runtime_error("runner crashed"); }),
               signal_sn, signal_rc);

  assert(!proc.ready());
  assert(proc.signal(core::signal::interrupt));
  assert(proc.wait() == errc::could_not_recv_result);

  bool caught = false;
  try
  {
    proc.join();
  }
  catch (const std::runtime_error &e)
  {
    caught = std::string(e.what()) == "runner crashed";
  }
  assert(caught);
  assert(!proc.joinable());

  // Fault was observed; a second join is quiet.
  proc.join();
}

static void test_joinable_while_another_thread_joins()
{
  auto [signal_sn, signal_rc] = make_channel<core::signal>(1);

  process proc(make_fn_runner([](signal_receiver signals) -> std::error_code
                              {
                                auto sig = signals.recv();
                                (void)sig;
                                return {}; }),
               signal_sn, signal_rc);

  assert(proc.joinable());

  std::thread joiner([&proc]()
                     { proc.join(); });

  // Polled concurrently with join(); flips exactly once.
  assert(proc.joinable());
  assert(proc.signal(core::signal::interrupt));
  while (proc.joinable())
    std::this_thread::yield();

  joiner.join();
  assert(!proc.joinable());
  assert(!proc.wait());
}

static void test_signal_after_runner_finished()
{
  auto [signal_sn, signal_rc] = make_channel<core::signal>(4);

  process proc(make_fn_runner([](signal_receiver) -> std::error_code
                              { return {}; }),
               signal_sn, signal_rc);

  assert(!proc.wait());
  proc.join();

  // The runner dropped its receiver; nothing accepts signals anymore.
  signal_rc = signal_receiver{};
  assert(!proc.signal(core::signal::hangup));
}

static void test_composer_under_process()
{
  auto [sn1, rc1] = make_channel<bool>(0);
  auto [sn2, rc2] = make_channel<bool>(0);

  std::vector<runner_ptr> runners;
  runners.push_back(std::make_unique<test_runner>(0, sn1));
  runners.push_back(std::make_unique<test_runner>(0, sn2));

  auto [signal_sn, signal_rc] = make_channel<core::signal>(16);
  process proc(std::make_unique<composer>(std::move(runners)), signal_sn, signal_rc);

  assert(!proc.ready());
  assert(proc.signal(core::signal::interrupt));
  assert(*rc1.recv());
  assert(*rc2.recv());
  assert(!proc.wait());
}

static void test_each_child_observes_one_interrupt()
{
  auto a = std::make_shared<signal_log>();
  auto b = std::make_shared<signal_log>();

  std::vector<runner_ptr> runners;
  runners.push_back(record_until(a, core::signal::interrupt));
  runners.push_back(record_until(b, core::signal::interrupt));

  auto [signal_sn, signal_rc] = make_channel<core::signal>(16);
  process proc(std::make_unique<composer>(std::move(runners)), signal_sn, signal_rc);

  assert(!proc.ready());
  assert(proc.signal(core::signal::interrupt));
  assert(!proc.wait());

  const std::vector<core::signal> expected{core::signal::interrupt};
  assert(a->snapshot() == expected);
  assert(b->snapshot() == expected);
}

static void test_composer_failure_under_process()
{
  auto [sn1, rc1] = make_channel<bool>(0);
  auto [sn2, rc2] = make_channel<bool>(0);

  std::vector<runner_ptr> runners;
  runners.push_back(std::make_unique<test_runner>(0, sn1));
  runners.push_back(std::make_unique<test_runner>(0, sn2));

  auto [signal_sn, signal_rc] = make_channel<core::signal>(16);
  process proc(std::make_unique<composer>(std::move(runners), core::signal::terminate),
               signal_sn, signal_rc);

  assert(!proc.ready());
  assert(proc.signal(core::signal::hangup));

  // Each runner sees either SIGHUP or the composer's SIGTERM; both fail.
  assert(!*rc1.recv());
  assert(!*rc2.recv());

  auto res = proc.wait();
  assert(core::is_runner_error(res));
  assert(res == test_errc::picky_signal);
}

static void test_null_runner_rejected()
{
  auto [signal_sn, signal_rc] = make_channel<core::signal>(1);

  bool thrown = false;
  try
  {
    process proc(nullptr, signal_sn, signal_rc);
  }
  catch (const std::system_error &e)
  {
    thrown = e.code() == errc::invalid_argument;
  }
  assert(thrown);
}

static void test_transition_table()
{
  using core::detail::proc_op;
  using core::detail::transition;

  std::atomic<proc_state> st{proc_state::init};
  assert(!transition(st, proc_op::ready));
  assert(st.load() == proc_state::setup_done);
  assert(transition(st, proc_op::ready) == errc::result_already_given);
  assert(!transition(st, proc_op::wait));
  assert(st.load() == proc_state::finished);
  assert(transition(st, proc_op::wait) == errc::result_already_given);
  assert(transition(st, proc_op::ready) == errc::result_already_given);
  assert(st.load() == proc_state::finished);

  std::atomic<proc_state> skip{proc_state::init};
  assert(!transition(skip, proc_op::wait));
  assert(skip.load() == proc_state::finished);

  assert(core::to_string(proc_state::setup_done) == "setup_done");
}

int main()
{
  test_transition_table();
  test_ready_process();
  test_second_ready_never_reruns_setup();
  test_wait_and_signal_process();
  test_runner_error_surfaces();
  test_setup_failure_short_circuits_run();
  test_wait_without_ready_after_setup_failure();
  test_drop_joins_thread();
  test_fault_reported_by_join();
  test_joinable_while_another_thread_joins();
  test_signal_after_runner_finished();
  test_composer_under_process();
  test_each_child_observes_one_interrupt();
  test_composer_failure_under_process();
  test_null_runner_rejected();

  std::cout << "corral_process_smoke: OK\n";
  return 0;
}
