#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include <corral/core/composer.hpp>
#include <corral/core/fn_runner.hpp>
#include <corral/core/launch.hpp>
#include <corral/detail/log.hpp>

namespace core = corral::core;

using core::composer;
using core::launch;
using core::make_fn_runner;
using core::runner_ptr;
using core::signal_receiver;

// Ticks until SIGINT or SIGTERM arrives.
runner_ptr ticker(const char *name, std::chrono::milliseconds period)
{
  return make_fn_runner([name, period](signal_receiver signals) -> std::error_code
                        {
                          std::size_t ticks = 0;
                          while (true)
                          {
                            while (auto sig = signals.try_recv())
                            {
                              if (*sig == core::signal::interrupt || *sig == core::signal::terminate)
                              {
                                std::cout << name << ": stopping after " << ticks << " ticks\n";
                                return {};
                              }
                            }

                            ++ticks;
                            std::this_thread::sleep_for(period);
                          } });
}

int main()
{
  corral::detail::set_log_level(corral::detail::log_level::debug);

  std::vector<runner_ptr> runners;
  runners.push_back(ticker("fast", std::chrono::milliseconds(10)));
  runners.push_back(ticker("slow", std::chrono::milliseconds(100)));

  // Subscribe before anything else spawns a thread.
  auto proc = launch(std::make_unique<composer>(std::move(runners), core::signal::terminate),
                     {core::signal::interrupt, core::signal::terminate});

  if (auto ec = proc->ready())
  {
    std::cerr << "setup failed: " << ec.message() << "\n";
    return 1;
  }

  std::cout << "running, press Ctrl-C to stop\n";

  if (auto ec = proc->wait())
  {
    std::cerr << "supervised work failed: " << ec.message() << "\n";
    return 1;
  }

  std::cout << "all runners stopped cleanly\n";
  return 0;
}
