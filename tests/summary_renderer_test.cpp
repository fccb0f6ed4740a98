// =============================================================================
// summary_renderer_test.cpp
// =============================================================================
// Unit tests for gymbridge::SummaryRenderer.
// =============================================================================

#include "gymbridge/render/summary_renderer.hpp"
#include "gymbridge/sim/bar_backtest_engine.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using gymbridge::StepSnapshot;
using gymbridge::SummaryRenderer;

static StepSnapshot snapshot(double reward) {
  StepSnapshot s;
  s.raw_state = {{1, 2, 0.5, 1.5, 10}};
  s.state = {0.0};
  s.reward = reward;
  s.done = false;
  s.info = {{"step", 1}};
  return s;
}

TEST(SummaryRendererTest, DisabledRendererSaysSo) {
  SummaryRenderer renderer(false, {"human"});
  EXPECT_EQ(renderer.render({"human"}), "Rendering disabled");
}

TEST(SummaryRendererTest, UnsupportedModeIsReported) {
  SummaryRenderer renderer(true, {"human"});
  EXPECT_EQ(renderer.render({"agent"}), "agent mode not supported");
}

TEST(SummaryRendererTest, UnknownModeRejectedAtConstruction) {
  EXPECT_THROW(SummaryRenderer(true, {"rgb_array"}), std::invalid_argument);
}

TEST(SummaryRendererTest, StepRenderingsAreCachedPerMode) {
  SummaryRenderer renderer(true, {"human", "agent"});
  EXPECT_TRUE(renderer.render({"human"}).is_null());

  StepSnapshot step = snapshot(0.25);
  nlohmann::json human = renderer.render({"human"}, &step);
  EXPECT_EQ(human["mode"], "human");
  EXPECT_EQ(human["state"], step.raw_state);
  EXPECT_DOUBLE_EQ(human["reward"].get<double>(), 0.25);

  // Without a step the cached rendering comes back unchanged.
  EXPECT_EQ(renderer.render({"human"}), human);

  nlohmann::json both = renderer.render({"human", "agent"}, &step);
  EXPECT_TRUE(both.contains("human"));
  EXPECT_EQ(both["agent"]["state"], step.state);
}

TEST(SummaryRendererTest, SendFalseOnlyRefreshesCache) {
  SummaryRenderer renderer(true, {"human"});
  StepSnapshot step = snapshot(-1.0);
  EXPECT_TRUE(renderer.render({"human"}, &step, false).is_null());
  EXPECT_DOUBLE_EQ(renderer.render({"human"})["reward"].get<double>(), -1.0);
}

TEST(SummaryRendererTest, EpisodeRenderingSummarizesObservers) {
  SummaryRenderer renderer(true, {"episode"});
  gymbridge::BarBacktestEngine engine;
  engine.addObserver(gymbridge::ObserverKind::DrawDown);
  engine.addData(gymbridge::test::makeBars(30), "feed");
  engine.run();

  renderer.renderEpisode(engine);
  EXPECT_EQ(renderer.episodesRendered(), 1u);

  nlohmann::json episode = renderer.render({"episode"});
  EXPECT_EQ(episode["length"], 30);
  EXPECT_EQ(episode["observers"]["drawdown"]["points"], 21);
}
