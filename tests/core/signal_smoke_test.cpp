#include <cassert>
#include <csignal>
#include <iostream>
#include <sstream>

#include <corral/core/signal.hpp>

// ::signal from <csignal> would hide an unqualified enum name
namespace core = corral::core;

using core::from_native;
using core::to_native;
using core::to_string;

static void test_names()
{
  assert(to_string(core::signal::interrupt) == "SIGINT");
  assert(to_string(core::signal::hangup) == "SIGHUP");
  assert(to_string(core::signal::winch) == "SIGWINCH");

  std::ostringstream os;
  os << core::signal::terminate;
  assert(os.str() == "SIGTERM");
}

static void test_native_mapping()
{
  assert(to_native(core::signal::interrupt) == SIGINT);
  assert(to_native(core::signal::terminate) == SIGTERM);
  assert(to_native(core::signal::hangup) == SIGHUP);
  assert(to_native(core::signal::user1) == SIGUSR1);

  assert(from_native(SIGINT) == core::signal::interrupt);
  assert(from_native(SIGALRM) == core::signal::alarm);
  assert(!from_native(-1));
  assert(!from_native(100000));
}

static void test_every_signal_has_identity()
{
  for (int i = 0; i <= static_cast<int>(core::signal::winch); ++i)
  {
    const auto sig = static_cast<core::signal>(i);
    assert(to_string(sig) != "SIG?");

    const int native = to_native(sig);
    if (native >= 0)
      assert(from_native(native).has_value());
  }
}

int main()
{
  test_names();
  test_native_mapping();
  test_every_signal_has_identity();

  std::cout << "corral_signal_smoke: OK\n";
  return 0;
}
