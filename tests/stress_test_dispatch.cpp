#include "sim/simulation.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace game_lb;
using namespace game_lb::sim;

// Repeated full runs with a high player count and a short processing range.
// Checks the conservation counts after every round.
int main(int argc, char **argv) {
  int rounds = 20;
  std::size_t players = 5000;
  std::size_t concurrency = std::thread::hardware_concurrency() * 4;

  if (argc > 1)
    rounds = std::atoi(argv[1]);
  if (argc > 2)
    players = static_cast<std::size_t>(std::atoll(argv[2]));
  if (argc > 3)
    concurrency = static_cast<std::size_t>(std::atoll(argv[3]));

  std::cout << "Starting Stress Test: " << rounds << " rounds of " << players
            << " players, concurrency " << concurrency << std::endl;

  for (int round = 0; round < rounds; ++round) {
    auto sim = Simulation::create({.server_count = 7,
                                   .num_players = players,
                                   .concurrency_limit = concurrency,
                                   .processing_time_min = 0.0,
                                   .processing_time_max = 2.0,
                                   .time_scale = 1e-4});
    if (!sim) {
      std::cerr << "create failed: " << sim.error().message() << std::endl;
      return 1;
    }

    auto summary = sim->run();
    if (!summary) {
      std::cerr << "run failed: " << summary.error().message() << std::endl;
      return 1;
    }

    std::uint64_t served = 0;
    std::uint64_t lo = UINT64_MAX;
    std::uint64_t hi = 0;
    for (const auto &s : sim->pool().snapshot()) {
      served += s.requests_served;
      lo = std::min(lo, s.requests_served);
      hi = std::max(hi, s.requests_served);
    }
    const auto records = sim->sink().drain().size();

    if (!summary->all_succeeded() || served != players || records != players ||
        hi - lo > 1) {
      std::cerr << "Round " << round << " FAILED: succeeded="
                << summary->succeeded << " served=" << served
                << " records=" << records << " spread=" << (hi - lo)
                << std::endl;
      return 1;
    }
    std::cout << "Round " << round << ": " << players << " requests in "
              << summary->wall_time.count() << "s" << std::endl;
  }

  std::cout << "Stress Test Completed Successfully" << std::endl;
  return 0;
}
