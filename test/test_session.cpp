#include "doctest/doctest.h"
#include "claimtrax/session.hpp"

#include <cmath>
#include <vector>

using namespace claimtrax;
using namespace std::chrono_literals;

namespace {
    const Coordinate origin = utils::make_coordinate(52.0, 5.0);
    const Timestamp t0 = Timestamp{} + 1000h;

    Coordinate at(double east_m, double north_m) {
        double lat = origin.latitude + utils::to_degrees(north_m / utils::EARTH_RADIUS_M);
        double lon = origin.longitude +
                     utils::to_degrees(east_m / (utils::EARTH_RADIUS_M * std::cos(utils::to_radians(origin.latitude))));
        return utils::make_coordinate(lat, lon);
    }

    // Feeds fixes at walking pace, one every `step` starting at t0
    struct Walker {
        TrackingSession &session;
        Timestamp now = t0;
        Clock::duration step = 12s;

        FixOutcome walk_to(double east_m, double north_m) {
            FixOutcome outcome = session.process_fix(Fix{at(east_m, north_m), now, 5.0});
            now += step;
            return outcome;
        }

        void walk(const std::vector<std::pair<double, double>> &points) {
            for (const auto &[e, n] : points)
                walk_to(e, n);
        }
    };

    // 50 m square, three fixes per side
    const std::vector<std::pair<double, double>> square_walk = {
        {0, 0},    {50.0 / 3, 0}, {100.0 / 3, 0}, {50, 0},  {50, 50.0 / 3}, {50, 100.0 / 3},
        {50, 50},  {100.0 / 3, 50}, {50.0 / 3, 50}, {0, 50}, {0, 100.0 / 3}, {0, 50.0 / 3}};

    Territory foreign_block() {
        return make_territory("alice", Path{at(100, 0), at(200, 0), at(200, 100), at(100, 100)}, t0, "t-alice");
    }
} // namespace

TEST_CASE("Formatting helpers") {
    CHECK(format_duration(0.0) == "00:00");
    CHECK(format_duration(125.7) == "02:05");
    CHECK(format_duration(-3.0) == "00:00");
    CHECK(format_duration(3725.0) == "62:05");
    CHECK(format_distance(0.0) == "0 m");
    CHECK(format_distance(950.0) == "950 m");
    CHECK(format_distance(1234.0) == "1.2 km");
}

TEST_CASE("Walking a square produces a valid claim") {
    TerritoryRoster roster;
    TrackingSession session(Config{}, "bob", roster);
    Walker walker{session};

    CHECK(session.state() == SessionState::Idle);
    REQUIRE(session.start(t0));
    CHECK(session.tracking());
    CHECK_FALSE(session.start(t0));

    for (std::size_t i = 0; i < square_walk.size(); ++i) {
        FixOutcome outcome = walker.walk_to(square_walk[i].first, square_walk[i].second);
        CHECK(outcome.verdict == FixVerdict::Accepted);
        CHECK(outcome.recorded);
        if (i + 1 < square_walk.size())
            CHECK_FALSE(session.closed());
    }

    CHECK(session.path().size() == 12);
    CHECK(session.closed());
    CHECK_FALSE(session.self_intersecting());
    CHECK(session.total_distance() == doctest::Approx(11 * 50.0 / 3).epsilon(0.01));
    CHECK_FALSE(session.claim_record().has_value());

    auto outcome = session.stop(walker.now);
    REQUIRE(outcome.has_value());
    CHECK(outcome->result.is_valid);
    CHECK(outcome->result.computed_area_sqm == doctest::Approx(2500.0).epsilon(0.05));
    REQUIRE(outcome->record.has_value());
    CHECK(outcome->record->owner_id == "bob");
    CHECK(outcome->record->point_count == 12);
    CHECK(outcome->record->started_at == t0);
    CHECK(outcome->record->completed_at == walker.now);
    CHECK(session.state() == SessionState::Valid);
    CHECK(session.claim_record().has_value());

    SessionSnapshot snap = session.snapshot(walker.now + 1h);
    CHECK(snap.state == SessionState::Valid);
    CHECK(snap.duration_s == doctest::Approx(144.0));
    CHECK(snap.point_count == 12);
    CHECK(snap.closed);
    CHECK_FALSE(snap.blocking());
    CHECK_FALSE(snap.last_reason.has_value());

    SUBCASE("Stop twice is ignored") { CHECK_FALSE(session.stop(walker.now).has_value()); }

    SUBCASE("A valid session cannot be resumed") { CHECK_FALSE(session.resume()); }

    SUBCASE("Restart discards the finished session") {
        CHECK(session.start(walker.now));
        CHECK(session.path().empty());
        CHECK_FALSE(session.closed());
        CHECK_FALSE(session.claim_record().has_value());
    }
}

TEST_CASE("Fixes outside a tracking session are ignored") {
    TerritoryRoster roster;
    TrackingSession session(Config{}, "bob", roster);
    FixOutcome outcome = session.process_fix(Fix{origin, t0, std::nullopt});
    CHECK(outcome.verdict == FixVerdict::Ignored);
    CHECK_FALSE(outcome.recorded);
    CHECK(session.path().empty());
}

TEST_CASE("Close fixes are not recorded and drift is dropped") {
    TerritoryRoster roster;
    TrackingSession session(Config{}, "bob", roster);
    Walker walker{session};
    session.start(t0);

    walker.walk_to(0, 0);
    FixOutcome near = walker.walk_to(4, 0);
    CHECK(near.verdict == FixVerdict::Accepted);
    CHECK_FALSE(near.recorded);

    FixOutcome jump = walker.walk_to(600, 0);
    CHECK(jump.verdict == FixVerdict::GpsDrift);
    CHECK_FALSE(jump.recorded);
    CHECK(session.path().size() == 1);
    CHECK(session.consecutive_overspeed_count() == 0);
}

TEST_CASE("Sustained fast movement stops the session") {
    TerritoryRoster roster;
    TrackingSession session(Config{}, "bob", roster);
    Walker walker{session, t0, 10s};
    session.start(t0);

    walker.walk_to(0, 0);
    double step = 35.0 / 3.6 * 10.0;

    FixOutcome first = walker.walk_to(step, 0);
    CHECK(first.verdict == FixVerdict::SpeedWarning);
    CHECK_FALSE(first.recorded);
    CHECK(session.tracking());

    FixOutcome second = walker.walk_to(2 * step, 0);
    CHECK(second.verdict == FixVerdict::SpeedViolationFatal);
    REQUIRE(second.stopped.has_value());
    CHECK_FALSE(second.stopped->result.is_valid);
    CHECK(second.stopped->result.failure_reason == ReasonCode::InsufficientPoints);
    CHECK(session.state() == SessionState::Invalid);
    CHECK(session.forced_stop_reason() == ReasonCode::SpeedViolationFatal);

    SessionSnapshot snap = session.snapshot(walker.now);
    CHECK(snap.speed_alert == SpeedAlert::Fatal);
    CHECK(snap.forced_stop_reason == ReasonCode::SpeedViolationFatal);
    CHECK(snap.blocking());

    SUBCASE("Resume clears the alert and keeps the path") {
        CHECK(session.resume());
        CHECK(session.tracking());
        CHECK(session.consecutive_overspeed_count() == 0);
        CHECK(session.path().size() == 1);
        CHECK_FALSE(session.forced_stop_reason().has_value());
        CHECK(session.snapshot(walker.now).speed_alert == SpeedAlert::None);
    }
}

TEST_CASE("Stopping early then resuming completes the claim") {
    TerritoryRoster roster;
    TrackingSession session(Config{}, "bob", roster);
    Walker walker{session};
    session.start(t0);

    walker.walk({square_walk.begin(), square_walk.begin() + 6});
    auto early = session.stop(walker.now);
    REQUIRE(early.has_value());
    CHECK(early->result.failure_reason == ReasonCode::InsufficientPoints);
    CHECK_FALSE(early->record.has_value());
    CHECK(session.state() == SessionState::Invalid);
    CHECK(session.snapshot(walker.now).last_reason == ReasonCode::InsufficientPoints);

    REQUIRE(session.resume());
    CHECK(session.path().size() == 6);
    walker.walk({square_walk.begin() + 6, square_walk.end()});

    auto done = session.stop(walker.now);
    REQUIRE(done.has_value());
    CHECK(done->result.is_valid);
    CHECK(done->record->point_count == 12);
}

TEST_CASE("A figure-eight is flagged live and rejected") {
    TerritoryRoster roster;
    TrackingSession session(Config{}, "bob", roster);
    Walker walker{session};
    session.start(t0);

    std::vector<std::pair<double, double>> eight = {{0, 0},   {12, 12}, {24, 24}, {36, 36}, {48, 48}, {60, 60},
                                                    {60, 45}, {60, 30}, {60, 15}, {60, 0},  {48, 12}, {36, 24},
                                                    {24, 36}, {12, 48}, {0, 60},  {0, 45},  {0, 30},  {0, 15}};
    for (std::size_t i = 0; i < eight.size(); ++i) {
        walker.walk_to(eight[i].first, eight[i].second);
        if (i == 11)
            CHECK_FALSE(session.self_intersecting());
    }
    CHECK(session.self_intersecting());
    CHECK(session.snapshot(walker.now).self_intersecting);

    auto outcome = session.stop(walker.now);
    REQUIRE(outcome.has_value());
    CHECK(outcome->result.failure_reason == ReasonCode::SelfIntersection);
}

TEST_CASE("Approaching a foreign territory raises the warning level") {
    TerritoryRoster roster({foreign_block()});
    TrackingSession session(Config{}, "bob", roster);
    Walker walker{session};
    session.start(t0);

    walker.walk_to(-60, 10);
    CHECK(session.collision().warning_level == WarningLevel::Safe);

    walker.walk({{-45, 10}, {-30, 10}, {-15, 10}, {0, 10}});
    CHECK(session.collision().warning_level == WarningLevel::Safe);

    walker.walk_to(15, 10);
    CHECK(session.collision().warning_level == WarningLevel::Caution);
    REQUIRE(session.collision().nearest_distance_m.has_value());
    CHECK(*session.collision().nearest_distance_m == doctest::Approx(std::hypot(85.0, 10.0)).epsilon(0.01));

    walker.walk({{30, 10}, {45, 10}, {60, 10}});
    CHECK(session.collision().warning_level == WarningLevel::Warning);
    CHECK_FALSE(session.snapshot(walker.now).blocking());

    walker.walk({{75, 10}, {90, 10}});
    CHECK(session.collision().warning_level == WarningLevel::Danger);
    CHECK(session.snapshot(walker.now).blocking());

    SUBCASE("Entering keeps tracking by default but blocks the claim") {
        FixOutcome inside = walker.walk_to(105, 10);
        CHECK(inside.recorded);
        CHECK_FALSE(inside.stopped.has_value());
        CHECK(session.collision().warning_level == WarningLevel::Violation);
        CHECK(session.collision().collision_type == CollisionType::PathCrossesTerritory);
        CHECK(session.tracking());

        auto outcome = session.stop(walker.now);
        REQUIRE(outcome.has_value());
        CHECK(outcome->result.failure_reason == ReasonCode::PathCrossesForeignTerritory);
    }

    SUBCASE("The owner's own territory never warns") {
        TrackingSession own(Config{}, "ALICE", roster);
        Walker w{own};
        own.start(t0);
        w.walk({{90, 10}, {105, 10}});
        CHECK(own.collision().warning_level == WarningLevel::Safe);
    }
}

TEST_CASE("Entering a foreign territory can stop tracking") {
    TerritoryRoster roster({foreign_block()});
    Config config;
    config.collision.stop_on_violation = true;
    TrackingSession session(config, "bob", roster);
    Walker walker{session};
    session.start(t0);

    walker.walk({{60, 10}, {75, 10}, {90, 10}});
    FixOutcome inside = walker.walk_to(105, 10);
    REQUIRE(inside.stopped.has_value());
    CHECK(inside.stopped->result.failure_reason == ReasonCode::PathCrossesForeignTerritory);
    CHECK(session.state() == SessionState::Invalid);
    CHECK(session.forced_stop_reason() == ReasonCode::PathCrossesForeignTerritory);
}

TEST_CASE("Reset returns to idle") {
    TerritoryRoster roster;
    TrackingSession session(Config{}, "bob", roster);
    Walker walker{session};
    session.start(t0);
    walker.walk({square_walk.begin(), square_walk.begin() + 3});
    auto version = session.snapshot(walker.now).path_version;

    session.reset();
    SessionSnapshot snap = session.snapshot(walker.now);
    CHECK(snap.state == SessionState::Idle);
    CHECK(snap.point_count == 0);
    CHECK(snap.duration_s == 0.0);
    CHECK(snap.path_version != version);
    CHECK_FALSE(session.last_recorded_fix().has_value());
}

TEST_CASE("An unusable configuration is rejected") {
    TerritoryRoster roster;
    Config config;
    config.closure.minimum_path_points = 1;
    CHECK_THROWS_AS(TrackingSession(config, "bob", roster), std::invalid_argument);
}

TEST_CASE("A tick re-checks the path tip without recording") {
    TerritoryRoster roster;
    TrackingSession session(Config{}, "bob", roster);
    Walker walker{session};

    CHECK_FALSE(session.tick(t0).has_value());

    session.start(t0);
    CHECK_FALSE(session.tick(t0 + 1s).has_value());

    walker.walk({{0, 0}, {15, 0}});
    auto version = session.snapshot(walker.now).path_version;

    roster.replace({make_territory("alice", Path{at(-50, -50), at(50, -50), at(50, 50), at(-50, 50)}, t0, "t-alice")});

    SUBCASE("By default a violation only raises the level") {
        CHECK_FALSE(session.tick(walker.now).has_value());
        CHECK(session.collision().warning_level == WarningLevel::Violation);
        CHECK(session.tracking());
        SessionSnapshot snap = session.snapshot(walker.now);
        CHECK(snap.point_count == 2);
        CHECK(snap.path_version == version);
    }

    SUBCASE("A violation stops tracking when configured") {
        Config config;
        config.collision.stop_on_violation = true;
        TerritoryRoster later;
        TrackingSession strict(config, "bob", later);
        strict.start(t0);
        Walker w{strict};
        w.walk_to(0, 0);
        later.replace({foreign_block(),
                       make_territory("carol", Path{at(-20, -20), at(20, -20), at(20, 20), at(-20, 20)}, t0)});
        auto outcome = strict.tick(w.now);
        REQUIRE(outcome.has_value());
        CHECK(outcome->result.failure_reason == ReasonCode::PointInForeignTerritory);
        CHECK(strict.state() == SessionState::Invalid);
        CHECK(strict.forced_stop_reason() == ReasonCode::PointInForeignTerritory);
    }
}
