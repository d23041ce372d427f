/// @file test_simulation.cpp
/// @brief End-to-end tests for the Simulation façade.

#include "common/error.hpp"
#include "report/csv_exporter.hpp"
#include "sim/simulation.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace game_lb;
using namespace game_lb::sim;

namespace {

auto read_file(const std::filesystem::path &path) -> std::string {
  std::ifstream in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

auto count_lines(const std::string &text) -> std::size_t {
  return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
}

auto fast_config(std::size_t servers, std::size_t players) -> SimConfig {
  return SimConfig{
      .server_count = servers,
      .num_players = players,
      .processing_time_min = 1.0,
      .processing_time_max = 1.0,
      .time_scale = 1e-3,
  };
}

} // namespace

TEST(SimulationTest, ThreeServersNinePlayersEvenSplit) {
  std::ostringstream log;
  auto sim = Simulation::create(fast_config(3, 9), &log);
  ASSERT_TRUE(sim.has_value()) << sim.error().message();
  EXPECT_EQ(sim->state(), RunState::Idle);

  auto summary = sim->run();
  ASSERT_TRUE(summary.has_value());
  EXPECT_TRUE(summary->all_succeeded());
  EXPECT_EQ(sim->state(), RunState::Completed);

  for (const auto &s : sim->pool().snapshot()) {
    EXPECT_EQ(s.requests_served, 3u) << s.name;
    EXPECT_DOUBLE_EQ(s.total_response_time, 3.0) << s.name;
    EXPECT_DOUBLE_EQ(s.avg_response_time(), 1.0) << s.name;
  }
  EXPECT_EQ(sim->sink().drain().size(), 9u);
  EXPECT_EQ(count_lines(log.str()), 9u);
  EXPECT_FALSE(sim->sink().is_open());
}

TEST(SimulationTest, ZeroServersIsConfigurationError) {
  auto cfg = fast_config(0, 5);
  auto sim = Simulation::create(cfg);
  ASSERT_FALSE(sim.has_value());
  EXPECT_EQ(sim.error(), errc::invalid_server_count);
  EXPECT_TRUE(is_configuration_error(sim.error()));
}

TEST(SimulationTest, InvalidRangeIsConfigurationError) {
  auto cfg = fast_config(2, 5);
  cfg.processing_time_min = 5.0;
  cfg.processing_time_max = 1.0;
  auto sim = Simulation::create(cfg);
  ASSERT_FALSE(sim.has_value());
  EXPECT_EQ(sim.error(), errc::invalid_delay_range);
}

TEST(SimulationTest, SingleServerTakesAll) {
  auto sim = Simulation::create(fast_config(1, 7)).value();
  ASSERT_TRUE(sim.run().has_value());
  EXPECT_EQ(sim.pool().stats(0)->requests_served, 7u);
  for (const auto &r : sim.sink().drain()) {
    EXPECT_EQ(r.server_id, 0u);
  }
}

TEST(SimulationTest, ZeroPlayersProducesEmptyRun) {
  auto sim = Simulation::create(fast_config(3, 0)).value();
  auto summary = sim.run();
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->state, RunState::Completed);
  EXPECT_TRUE(sim.sink().drain().empty());

  auto rep = sim.build_report();
  EXPECT_EQ(rep.total_requests, 0u);
  EXPECT_EQ(rep.load_spread(), 0u);
}

TEST(SimulationTest, UniformDelaysStayInRange) {
  auto cfg = fast_config(3, 30);
  cfg.processing_time_min = 1.0;
  cfg.processing_time_max = 3.0;
  cfg.concurrency_limit = 10;
  auto sim = Simulation::create(cfg).value();
  ASSERT_TRUE(sim.run().has_value());

  auto rep = sim.build_report();
  EXPECT_EQ(rep.total_requests, 30u);
  EXPECT_GE(rep.min_response_time, 1.0);
  EXPECT_LE(rep.max_response_time, 3.0);
  EXPECT_EQ(rep.load_spread(), 0u);
  for (const auto &s : rep.servers) {
    EXPECT_EQ(s.players.size(), 10u);
  }
}

TEST(SimulationTest, InjectedDelayIsUsed) {
  auto sim = Simulation::create(fast_config(2, 4),
                                std::make_unique<FixedDelay>(2.5))
                 .value();
  ASSERT_TRUE(sim.run().has_value());
  for (const auto &r : sim.sink().drain()) {
    EXPECT_DOUBLE_EQ(r.response_time, 2.5);
  }
}

TEST(SimulationTest, RunTwiceRejected) {
  auto sim = Simulation::create(fast_config(2, 2)).value();
  ASSERT_TRUE(sim.run().has_value());
  auto again = sim.run();
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), std::errc::operation_not_permitted);
}

TEST(SimulationTest, MovedSimulationStillRuns) {
  auto created = Simulation::create(fast_config(3, 6)).value();
  Simulation sim{std::move(created)};
  ASSERT_TRUE(sim.run().has_value());
  EXPECT_EQ(sim.sink().drain().size(), 6u);
}

// ─── File outputs ───────────────────────────────────────────────────────

class SimulationFilesTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() / "game_lb_sim_test";
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }
  void TearDown() override { std::filesystem::remove_all(dir_); }

  std::filesystem::path dir_;
};

TEST_F(SimulationFilesTest, WritesLogCsvAndJson) {
  auto cfg = fast_config(3, 6);
  cfg.log_path = (dir_ / "server_logs.txt").string();
  cfg.csv_path = (dir_ / "metrics.csv").string();
  cfg.json_path = (dir_ / "run.json").string();

  auto sim = Simulation::create(cfg).value();
  auto summary = sim.run();
  ASSERT_TRUE(summary.has_value());
  EXPECT_FALSE(summary->run_error) << summary->run_error.message();

  const auto log = read_file(cfg.log_path);
  EXPECT_EQ(count_lines(log), 6u);
  EXPECT_NE(log.find("server=Game_Server_3"), std::string::npos);

  const auto csv = read_file(cfg.csv_path);
  EXPECT_EQ(csv.substr(0, csv.find('\n')), report::kCsvHeader);
  EXPECT_EQ(count_lines(csv), 7u);

  const auto doc = nlohmann::json::parse(read_file(cfg.json_path));
  EXPECT_EQ(doc["type"], "run");
  EXPECT_EQ(doc["summary"]["succeeded"], 6);
  EXPECT_EQ(doc["summary"]["state"], "Completed");
  EXPECT_EQ(doc["records"].size(), 6u);
  EXPECT_EQ(doc["report"]["servers"].size(), 3u);
  EXPECT_EQ(doc["report"]["servers"][0]["requests_served"], 2);
}

TEST_F(SimulationFilesTest, LogFileIsAppended) {
  auto cfg = fast_config(2, 2);
  cfg.log_path = (dir_ / "server_logs.txt").string();
  ASSERT_TRUE(Simulation::create(cfg).value().run().has_value());
  ASSERT_TRUE(Simulation::create(cfg).value().run().has_value());
  EXPECT_EQ(count_lines(read_file(cfg.log_path)), 4u);
}

TEST_F(SimulationFilesTest, UnwritableLogFailsCreate) {
  auto cfg = fast_config(2, 2);
  cfg.log_path = (dir_ / "missing" / "server_logs.txt").string();
  auto sim = Simulation::create(cfg);
  ASSERT_FALSE(sim.has_value());
  EXPECT_EQ(sim.error(), errc::sink_open_failed);
}

TEST_F(SimulationFilesTest, UnwritableCsvReportedAsRunError) {
  auto cfg = fast_config(2, 2);
  cfg.csv_path = (dir_ / "missing" / "metrics.csv").string();
  auto sim = Simulation::create(cfg).value();
  auto summary = sim.run();
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->run_error, errc::export_failed);
  EXPECT_EQ(summary->succeeded, 2u);
}
