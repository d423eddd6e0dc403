#include <floodgate/execution/engine.hpp>
#include <floodgate/limiter/flow.hpp>
#include <floodgate/schema/key/engine_keys.hpp>
#include <floodgate/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

using floodgate::schema::amount_t;
using floodgate::schema::flow_direction_t;

namespace {

constexpr auto kT0 = uint64_t{1'700'000'000};

floodgate::schema::register_path_t make_registration(
    const floodgate::schema::path_t& path,
    std::vector<floodgate::schema::quota_t> quotas) {
  return floodgate::schema::register_path_t{.path = path,
                                            .quotas = std::move(quotas)};
}

bool accepted(const floodgate::execution::transfer_result_t& result) {
  return std::holds_alternative<floodgate::schema::rate_limits_t>(result);
}

const floodgate::schema::rate_limit_exceeded_t& rejection(
    const floodgate::execution::transfer_result_t& result) {
  return std::get<floodgate::schema::rate_limit_exceeded_t>(result);
}

}  // namespace

TEST(engine_integration, unregistered_path_allows_everything_and_stores_nothing) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto path = floodgate::testing::make_path();

  for (auto direction : {flow_direction_t::in, flow_direction_t::out}) {
    auto result = engine.try_transfer(path, floodgate::schema::max_amount(),
                                      direction, kT0);
    ASSERT_TRUE(accepted(result));
    EXPECT_TRUE(std::get<floodgate::schema::rate_limits_t>(result).empty());
  }
  EXPECT_FALSE(engine.query_state(path).has_value());
  EXPECT_TRUE(engine.list_paths().empty());
}

TEST(engine_integration, empty_quota_list_is_unrestricted) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto path = floodgate::testing::make_path();
  engine.register_path(make_registration(path, {}), kT0);

  auto result =
      engine.try_transfer(path, amount_t{1'000'000}, flow_direction_t::out, kT0);
  ASSERT_TRUE(accepted(result));
  auto state = engine.query_state(path);
  ASSERT_TRUE(state.has_value());
  EXPECT_TRUE(state->empty());
}

TEST(engine_integration, send_then_receive_nets_to_zero) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto path = floodgate::testing::make_path();
  engine.register_path(
      make_registration(path, {floodgate::testing::make_quota(
                                  "daily", floodgate::testing::kDay, 1000, 1000)}),
      kT0);

  ASSERT_TRUE(accepted(
      engine.try_transfer(path, amount_t{750}, flow_direction_t::out, kT0 + 1)));
  ASSERT_TRUE(accepted(
      engine.try_transfer(path, amount_t{750}, flow_direction_t::in, kT0 + 2)));

  auto state = engine.query_state(path);
  ASSERT_TRUE(state.has_value());
  auto [balance_in, balance_out] =
      floodgate::limiter::balance(state->front().flow);
  EXPECT_EQ(balance_in, amount_t{0});
  EXPECT_EQ(balance_out, amount_t{0});

  // Netting frees the full send capacity again.
  EXPECT_TRUE(accepted(
      engine.try_transfer(path, amount_t{1000}, flow_direction_t::out, kT0 + 3)));
}

TEST(engine_integration, undo_send_restores_outbound_balance) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto path = floodgate::testing::make_path();
  engine.register_path(
      make_registration(path, {floodgate::testing::make_quota(
                                  "daily", floodgate::testing::kDay, 1000, 1000)}),
      kT0);
  ASSERT_TRUE(accepted(
      engine.try_transfer(path, amount_t{200}, flow_direction_t::out, kT0)));
  auto before = engine.query_state(path)->front().flow;

  ASSERT_TRUE(accepted(
      engine.try_transfer(path, amount_t{500}, flow_direction_t::out, kT0 + 10)));
  auto limits = engine.undo_send(path, amount_t{500});
  ASSERT_EQ(limits.size(), 1u);
  EXPECT_EQ(limits.front().flow, before);
  EXPECT_EQ(engine.query_state(path)->front().flow, before);
}

TEST(engine_integration, undo_send_after_rollover_never_underflows) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto path = floodgate::testing::make_path();
  engine.register_path(
      make_registration(path, {floodgate::testing::make_quota(
                                  "daily", floodgate::testing::kDay, 1000, 1000)}),
      kT0);
  ASSERT_TRUE(accepted(
      engine.try_transfer(path, amount_t{400}, flow_direction_t::out, kT0)));
  auto later = kT0 + floodgate::testing::kDay + 1;
  ASSERT_TRUE(accepted(
      engine.try_transfer(path, amount_t{100}, flow_direction_t::out, later)));

  auto limits = engine.undo_send(path, amount_t{400});
  ASSERT_EQ(limits.size(), 1u);
  EXPECT_EQ(limits.front().flow.outflow, amount_t{0});
  EXPECT_EQ(limits.front().flow.period_end, later + floodgate::testing::kDay);
}

TEST(engine_integration, undo_send_on_unregistered_path_is_noop) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto path = floodgate::testing::make_path();
  EXPECT_TRUE(engine.undo_send(path, amount_t{10}).empty());
  EXPECT_FALSE(engine.query_state(path).has_value());
}

TEST(engine_integration, weekly_window_rolls_over) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto path = floodgate::testing::make_path();
  engine.register_path(
      make_registration(path,
                        {floodgate::testing::make_quota(
                            "weekly", floodgate::testing::kWeek, 1000, 1000)}),
      kT0);

  auto first =
      engine.try_transfer(path, amount_t{300}, flow_direction_t::out, kT0);
  ASSERT_TRUE(accepted(first));
  EXPECT_EQ(std::get<floodgate::schema::rate_limits_t>(first)
                .front()
                .flow.outflow,
            amount_t{300});

  auto second =
      engine.try_transfer(path, amount_t{800}, flow_direction_t::out, kT0);
  ASSERT_FALSE(accepted(second));
  EXPECT_EQ(rejection(second).quota_name, "weekly");
  EXPECT_EQ(rejection(second).used, amount_t{300});
  EXPECT_EQ(rejection(second).maximum, amount_t{1000});
  EXPECT_EQ(rejection(second).reset, kT0 + floodgate::testing::kWeek);
  EXPECT_EQ(engine.query_state(path)->front().flow.outflow, amount_t{300});

  // Exactly at period_end the old window still applies.
  auto boundary = kT0 + floodgate::testing::kWeek;
  EXPECT_FALSE(accepted(
      engine.try_transfer(path, amount_t{800}, flow_direction_t::out, boundary)));

  auto later = boundary + 1;
  auto third =
      engine.try_transfer(path, amount_t{800}, flow_direction_t::out, later);
  ASSERT_TRUE(accepted(third));
  auto& flow = std::get<floodgate::schema::rate_limits_t>(third).front().flow;
  EXPECT_EQ(flow.outflow, amount_t{800});
  EXPECT_EQ(flow.period_end, later + floodgate::testing::kWeek);
}

TEST(engine_integration, weekly_cap_binds_across_daily_windows) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto path = floodgate::testing::make_path();
  engine.register_path(
      make_registration(
          path,
          {floodgate::testing::make_quota("daily", floodgate::testing::kDay,
                                          1000, 1000),
           floodgate::testing::make_quota("weekly", floodgate::testing::kWeek,
                                          5000, 5000)}),
      kT0);

  constexpr auto kStep = uint64_t{90'000};
  for (auto day = uint64_t{0}; day < 5; ++day) {
    ASSERT_TRUE(accepted(engine.try_transfer(
        path, amount_t{1000}, flow_direction_t::out, kT0 + day * kStep)))
        << "day " << day;
  }

  auto sixth = engine.try_transfer(path, amount_t{1}, flow_direction_t::out,
                                   kT0 + 5 * kStep);
  ASSERT_FALSE(accepted(sixth));
  EXPECT_EQ(rejection(sixth).quota_name, "weekly");
  EXPECT_EQ(rejection(sixth).used, amount_t{5000});

  // A fresh daily window alone does not unblock the weekly cap.
  auto seventh = engine.try_transfer(path, amount_t{1}, flow_direction_t::out,
                                     kT0 + 6 * kStep);
  ASSERT_FALSE(accepted(seventh));
  EXPECT_EQ(rejection(seventh).quota_name, "weekly");

  auto next_week = kT0 + floodgate::testing::kWeek + 1;
  EXPECT_TRUE(accepted(engine.try_transfer(path, amount_t{1000},
                                           flow_direction_t::out, next_week)));
}

TEST(engine_integration, failed_transfer_leaves_every_quota_untouched) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto path = floodgate::testing::make_path();
  engine.register_path(
      make_registration(
          path,
          {floodgate::testing::make_quota("loose", floodgate::testing::kDay,
                                          1000, 1000),
           floodgate::testing::make_quota("strict", floodgate::testing::kWeek,
                                          100, 100)}),
      kT0);
  ASSERT_TRUE(accepted(
      engine.try_transfer(path, amount_t{50}, flow_direction_t::out, kT0)));
  auto before = engine.query_state(path);

  auto result =
      engine.try_transfer(path, amount_t{60}, flow_direction_t::out, kT0 + 1);
  ASSERT_FALSE(accepted(result));
  EXPECT_EQ(rejection(result).quota_name, "strict");
  EXPECT_EQ(engine.query_state(path), before);
}

TEST(engine_integration, first_rejecting_quota_in_list_order_wins) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto path = floodgate::testing::make_path();
  engine.register_path(
      make_registration(
          path,
          {floodgate::testing::make_quota("first", floodgate::testing::kDay,
                                          10, 10),
           floodgate::testing::make_quota("second", floodgate::testing::kWeek,
                                          5, 5)}),
      kT0);
  auto result =
      engine.try_transfer(path, amount_t{20}, flow_direction_t::in, kT0);
  ASSERT_FALSE(accepted(result));
  EXPECT_EQ(rejection(result).quota_name, "first");
}

TEST(engine_integration, asymmetric_caps_are_independent) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto path = floodgate::testing::make_path();
  engine.register_path(
      make_registration(path, {floodgate::testing::make_quota(
                                  "daily", floodgate::testing::kDay, 100, 10)}),
      kT0);

  EXPECT_TRUE(accepted(
      engine.try_transfer(path, amount_t{100}, flow_direction_t::out, kT0)));
  // Inbound nets 100 of outbound before touching the 10 receive cap.
  EXPECT_TRUE(accepted(
      engine.try_transfer(path, amount_t{110}, flow_direction_t::in, kT0)));
  auto result =
      engine.try_transfer(path, amount_t{1}, flow_direction_t::in, kT0);
  ASSERT_FALSE(accepted(result));
  EXPECT_EQ(rejection(result).maximum, amount_t{10});
  EXPECT_EQ(rejection(result).used, amount_t{10});
  EXPECT_TRUE(accepted(
      engine.try_transfer(path, amount_t{100}, flow_direction_t::out, kT0)));
}

TEST(engine_integration, reset_targets_first_matching_quota_only) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto path = floodgate::testing::make_path();
  engine.register_path(
      make_registration(
          path,
          {floodgate::testing::make_quota("daily", floodgate::testing::kDay,
                                          1000, 1000),
           floodgate::testing::make_quota("weekly", floodgate::testing::kWeek,
                                          5000, 5000),
           floodgate::testing::make_quota("daily", floodgate::testing::kDay,
                                          2000, 2000)}),
      kT0);
  ASSERT_TRUE(accepted(
      engine.try_transfer(path, amount_t{700}, flow_direction_t::out, kT0)));

  auto error = engine.reset_path_quota(path, "daily", kT0 + 100);
  EXPECT_FALSE(error.has_value());

  auto state = engine.query_state(path);
  ASSERT_TRUE(state.has_value());
  ASSERT_EQ(state->size(), 3u);
  EXPECT_EQ((*state)[0].flow.outflow, amount_t{0});
  EXPECT_EQ((*state)[0].flow.period_end, kT0 + 100 + floodgate::testing::kDay);
  EXPECT_EQ((*state)[1].flow.outflow, amount_t{700});
  EXPECT_EQ((*state)[2].flow.outflow, amount_t{700});
  EXPECT_EQ((*state)[2].flow.period_end, kT0 + floodgate::testing::kDay);
}

TEST(engine_integration, reset_of_unknown_quota_reports_not_found) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto path = floodgate::testing::make_path();

  auto unregistered = engine.reset_path_quota(path, "daily", kT0);
  ASSERT_TRUE(unregistered.has_value());
  EXPECT_EQ(unregistered->quota_name, "daily");
  EXPECT_FALSE(engine.query_state(path).has_value());

  engine.register_path(
      make_registration(path, {floodgate::testing::make_quota(
                                  "daily", floodgate::testing::kDay, 10, 10)}),
      kT0);
  auto unknown = engine.reset_path_quota(path, "monthly", kT0);
  ASSERT_TRUE(unknown.has_value());
  EXPECT_EQ(unknown->path, path);
  EXPECT_EQ(unknown->quota_name, "monthly");
}

TEST(engine_integration, register_overwrites_and_deregister_unrestricts) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto path = floodgate::testing::make_path();
  engine.register_path(
      make_registration(path, {floodgate::testing::make_quota(
                                  "daily", floodgate::testing::kDay, 10, 10)}),
      kT0);
  ASSERT_TRUE(accepted(
      engine.try_transfer(path, amount_t{10}, flow_direction_t::out, kT0)));

  engine.register_path(
      make_registration(path, {floodgate::testing::make_quota(
                                  "daily", floodgate::testing::kDay, 20, 20)}),
      kT0 + 1);
  auto state = engine.query_state(path);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->front().flow.outflow, amount_t{0});
  EXPECT_EQ(state->front().quota.max_send, amount_t{20});

  EXPECT_TRUE(engine.deregister_path(path));
  EXPECT_FALSE(engine.deregister_path(path));
  EXPECT_TRUE(accepted(engine.try_transfer(
      path, amount_t{1'000'000}, flow_direction_t::out, kT0 + 2)));
  EXPECT_FALSE(engine.query_state(path).has_value());
}

TEST(engine_integration, register_paths_seeds_every_path) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  engine.register_paths(
      {make_registration(floodgate::testing::make_path("a", "channel-0", "x"),
                         {floodgate::testing::make_quota(
                             "daily", floodgate::testing::kDay, 1, 1)}),
       make_registration(floodgate::testing::make_path("b", "channel-1", "y"),
                         {floodgate::testing::make_quota(
                             "weekly", floodgate::testing::kWeek, 1, 1)})},
      kT0);
  EXPECT_EQ(engine.list_paths().size(), 2u);
}

TEST(engine_integration, zero_duration_window_rolls_every_second) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto path = floodgate::testing::make_path();
  engine.register_path(
      make_registration(path,
                        {floodgate::testing::make_quota("instant", 0, 100, 100)}),
      kT0);
  EXPECT_EQ(engine.query_state(path)->front().flow.period_end, kT0);

  ASSERT_TRUE(accepted(
      engine.try_transfer(path, amount_t{100}, flow_direction_t::out, kT0)));
  auto repeated =
      engine.try_transfer(path, amount_t{100}, flow_direction_t::out, kT0);
  ASSERT_FALSE(accepted(repeated));
  EXPECT_EQ(rejection(repeated).used, amount_t{100});
  EXPECT_EQ(rejection(repeated).reset, kT0);

  auto next = engine.try_transfer(path, amount_t{100}, flow_direction_t::out,
                                  kT0 + 1);
  ASSERT_TRUE(accepted(next));
  auto& flow = std::get<floodgate::schema::rate_limits_t>(next).front().flow;
  EXPECT_EQ(flow.outflow, amount_t{100});
  EXPECT_EQ(flow.period_end, kT0 + 1);
}

TEST(engine_integration, register_paths_is_all_or_nothing) {
  auto fixture = floodgate::testing::engine_fixture{};
  auto& engine = fixture.engine();
  auto first = floodgate::testing::make_path("a", "channel-0", "x");
  auto second = floodgate::testing::make_path("b", "channel-1", "y");
  auto& entries = *fixture.storage().entries;
  auto second_key =
      floodgate::schema::key::make_path_key(fixture.encoder(), second);
  entries[second_key] = floodgate::schema::bytes_t{0xFF};

  EXPECT_THROW(
      engine.register_paths(
          {make_registration(first, {floodgate::testing::make_quota(
                                        "daily", floodgate::testing::kDay, 1, 1)}),
           make_registration(second,
                             {floodgate::testing::make_quota(
                                 "weekly", floodgate::testing::kWeek, 1, 1)})},
          kT0),
      floodgate::storage::storage_error);
  EXPECT_FALSE(engine.query_state(first).has_value());
  EXPECT_EQ(entries.at(second_key), floodgate::schema::bytes_t{0xFF});
}
