/**
 *
 *  @file error_slot_smoke_test.cpp
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
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <corral/core/error.hpp>
#include <corral/core/error_slot.hpp>

using corral::core::errc;
using corral::core::error_slot;
using corral::core::fault_slot;

static void test_empty_code_never_fills()
{
  error_slot slot;
  assert(!slot.try_set(std::error_code{}));
  assert(!slot.has_value());
  assert(!slot.take());
}

static void test_first_writer_wins()
{
  error_slot slot;
  assert(slot.try_set(make_error_code(errc::closed)));
  assert(!slot.try_set(make_error_code(errc::not_supported)));

  auto v = slot.take();
  assert(v && *v == errc::closed);

  // Drained.
  assert(!slot.take());
}

static void test_concurrent_writers()
{
  error_slot slot;
  std::atomic<int> winners{0};
  std::atomic<int> winner_value{-1};

  std::vector<std::thread> threads;
  for (int i = 1; i <= 16; ++i)
  {
    threads.emplace_back([&, i]()
                         {
                           if (slot.try_set(std::error_code(i, std::generic_category())))
                           {
                             winners.fetch_add(1);
                             winner_value = i;
                           } });
  }

  for (auto &t : threads)
    t.join();

  assert(winners.load() == 1);
  auto v = slot.take();
  assert(v && v->value() == winner_value.load());
}

static void test_fault_rethrow()
{
  fault_slot faults;
  faults.rethrow_if_set(); // empty: no-op

  assert(faults.try_set(std::make_exception_ptr(std::runtime_error("first"))));
  assert(!faults.try_set(std::make_exception_ptr(std::runtime_error("second"))));

  bool caught = false;
  try
  {
    faults.rethrow_if_set();
  }
  catch (const std::runtime_error &e)
  {
    caught = std::string(e.what()) == "first";
  }
  assert(caught);
  assert(!faults.has_value());
}

int main()
{
  test_empty_code_never_fills();
  test_first_writer_wins();
  test_concurrent_writers();
  test_fault_rethrow();

  std::cout << "corral_error_slot_smoke: OK\n";
  return 0;
}
