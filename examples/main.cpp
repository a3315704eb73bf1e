#include <iomanip>
#include <iostream>
#include <thread>

#include <datapod/datapod.hpp>

#include "claimtrax/claimtrax.hpp"
#include "claimtrax/utils/walk.hpp"

int main() {
    // Reference point for the simulated walk
    datapod::Geo world_datum{51.98954034749562, 5.6584737410504715, 0.0};

    // The walk is replayed 100x faster than real time; fixes and ticks share the simulated clock
    constexpr double speedup = 100.0;

    claimtrax::Journal journal(200, true);
    claimtrax::Config config;

    claimtrax::TrackingService service(config, "walker-01", journal);

    // A neighbour already claimed the block east of the walk
    std::vector<datapod::Point> block{datapod::Point{120.0, -20.0, 0.0}, datapod::Point{220.0, -20.0, 0.0},
                                      datapod::Point{220.0, 100.0, 0.0}, datapod::Point{120.0, 100.0, 0.0}};
    service.refresh_roster({claimtrax::make_territory(
        "neighbour-02", claimtrax::walk::enu_to_path(block, world_datum), claimtrax::Clock::now())});

    std::size_t shown_points = 0;
    service.subscribe([&shown_points](const claimtrax::SessionSnapshot &snap) {
        if (snap.point_count == shown_points && snap.state == claimtrax::SessionState::Tracking)
            return;
        shown_points = snap.point_count;
        std::cout << "  " << claimtrax::session_state_to_string(snap.state) << " | " << std::setw(2)
                  << snap.point_count << " pts | " << claimtrax::format_distance(snap.total_distance_m) << " | "
                  << claimtrax::format_duration(snap.duration_s) << " | "
                  << claimtrax::warning_level_to_string(snap.warning_level) << (snap.closed ? " | closed" : "")
                  << "\n";
    });

    // 80 x 80 m loop, ending near the start
    std::vector<datapod::Point> corners{datapod::Point{0.0, 0.0, 0.0}, datapod::Point{80.0, 0.0, 0.0},
                                       datapod::Point{80.0, 80.0, 0.0}, datapod::Point{0.0, 80.0, 0.0},
                                       datapod::Point{0.0, 15.0, 0.0}};
    auto path = claimtrax::walk::enu_to_path(claimtrax::walk::densify(corners, 12.0), world_datum);

    const auto wall_start = claimtrax::Clock::now();
    const auto sim_start = wall_start;
    auto fixes = claimtrax::walk::timed_fixes(path, 4.5, sim_start);

    auto to_simulated = [&](claimtrax::Timestamp wall) {
        return sim_start + std::chrono::duration_cast<claimtrax::Clock::duration>((wall - wall_start) * speedup);
    };
    auto to_wall = [&](claimtrax::Timestamp simulated) {
        return wall_start + std::chrono::duration_cast<claimtrax::Clock::duration>((simulated - sim_start) / speedup);
    };

    service.start(sim_start);

    auto tick_interval = std::chrono::duration_cast<std::chrono::milliseconds>(config.tick.sampling_interval / speedup);
    claimtrax::SamplingTicker ticker(tick_interval, [&](claimtrax::Timestamp now) {
        return service.on_tick(to_simulated(now));
    });
    ticker.start();

    for (const auto &fix : fixes) {
        std::this_thread::sleep_until(to_wall(fix.timestamp));
        auto result = service.on_fix(fix);
        if (result.verdict != claimtrax::FixVerdict::Accepted)
            std::cout << "  fix " << claimtrax::fix_verdict_to_string(result.verdict) << "\n";
    }

    auto outcome = service.stop(fixes.back().timestamp);
    ticker.stop();

    if (!outcome) {
        std::cerr << "Session was not tracking\n";
        return 1;
    }

    if (outcome->result.is_valid) {
        std::cout << "Claim accepted: " << std::fixed << std::setprecision(0) << outcome->result.computed_area_sqm
                  << " m2\n";
        std::cout << "WKT: " << outcome->record->to_wkt() << "\n";
    } else {
        std::cout << "Claim rejected: " << claimtrax::reason_to_string(*outcome->result.failure_reason) << "\n";
    }

    journal.set_echo(false);
    std::cout << "\n" << journal.export_text();
    return 0;
}
