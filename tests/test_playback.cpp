#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <wfsim/builder.hpp>
#include <wfsim/config.hpp>
#include <wfsim/playback.hpp>

using Catch::Approx;
using namespace wfsim;

static SimulationConfig short_run(SimulationConfig cfg) {
  cfg.total_days = 1;
  cfg.hours_per_step = 12; // frames at 0, 12, 24, 36
  return cfg;
}

TEST_CASE("Playback groups features into one frame per step") {
  auto seq = build_fire_sequence(short_run(danger_zone_config()));
  Playback pb(seq);
  REQUIRE(pb.frame_count() == 4);
  REQUIRE(pb.frame() == 0);
  REQUIRE(pb.time_hours() == Approx(0.0));

  auto r1 = pb.frame_range(1);
  REQUIRE(r1.first == 3);
  REQUIRE(r1.second == 6);
  auto r3 = pb.frame_range(3);
  REQUIRE(r3.second == seq.features.size());
  auto none = pb.frame_range(99);
  REQUIRE(none.first == none.second);
}

TEST_CASE("Playback advance stops on the last frame without loop") {
  auto seq = build_fire_sequence(short_run(unbounded_config()));
  Playback pb(seq);
  REQUIRE(pb.playing);
  REQUIRE_FALSE(pb.loop());

  pb.advance(12.0);
  REQUIRE(pb.frame() == 1);
  pb.advance(5.0);
  REQUIRE(pb.frame() == 1);
  pb.advance(19.0);
  REQUIRE(pb.frame() == 3);
  REQUIRE(pb.at_end());
  REQUIRE(pb.playing);

  pb.advance(12.0); // reaches 48 = last frame + one period
  REQUIRE(pb.frame() == 3);
  REQUIRE_FALSE(pb.playing);

  // Paused cursor does not move
  pb.seek_frame(0);
  pb.advance(24.0);
  REQUIRE(pb.frame() == 0);
}

TEST_CASE("Playback wraps to the first frame when looping") {
  auto seq = build_fire_sequence(short_run(danger_zone_config()));
  Playback pb(seq);
  REQUIRE(pb.loop());

  pb.advance(47.0);
  REQUIRE(pb.frame() == 3);
  pb.advance(1.0);
  REQUIRE(pb.frame() == 0);
  REQUIRE(pb.time_hours() == Approx(0.0));
  REQUIRE(pb.playing);
}

TEST_CASE("Playback seek and step clamp to the frame range") {
  auto seq = build_fire_sequence(short_run(unbounded_config()));
  Playback pb(seq);
  pb.seek_frame(100);
  REQUIRE(pb.frame() == 3);
  REQUIRE(pb.time_hours() == Approx(36.0));
  pb.step_forward();
  REQUIRE(pb.frame() == 3);
  pb.step_back();
  REQUIRE(pb.frame() == 2);
  pb.seek_frame(0);
  pb.step_back();
  REQUIRE(pb.frame() == 0);

  pb.set_loop(true);
  REQUIRE(pb.loop());
}

TEST_CASE("Playback on an empty sequence is inert") {
  Playback pb{FireSequence{}};
  REQUIRE(pb.frame_count() == 0);
  pb.advance(10.0);
  pb.step_forward();
  REQUIRE(pb.frame() == 0);
  REQUIRE_FALSE(pb.at_end());
}
