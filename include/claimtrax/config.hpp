#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace claimtrax {

    /**
     * @brief Thresholds of the speed and drift classifier (km/h)
     */
    struct SpeedConfig {
        double warning_speed_threshold = 15.0;
        double stop_speed_threshold = 30.0;
        double gps_drift_threshold = 50.0;
        int warning_consecutive_count = 2;
        int stop_consecutive_count = 2;
    };

    struct SamplerConfig {
        double min_distance_for_new_point = 10.0; ///< Metres between recorded vertices
    };

    struct ClosureConfig {
        std::size_t minimum_path_points = 10;
        double closure_distance_threshold = 30.0; ///< Metres between first and last vertex
    };

    /**
     * @brief Tuning of both self-intersection checks
     *
     * The skip counts and noise threshold are empirical values for consumer GPS
     * accuracy (5-20 m) and are exposed for recalibration.
     */
    struct IntersectionConfig {
        std::size_t incremental_skip_tail_count = 2;
        std::size_t min_segment_gap = 5;
        std::size_t skip_head_count = 4;
        std::size_t skip_tail_count = 4;
        double intersection_noise_threshold = 10.0; ///< Metres
    };

    struct ValidationConfig {
        double minimum_total_distance = 50.0; ///< Metres
        double minimum_enclosed_area = 100.0; ///< Square metres
    };

    /**
     * @brief Proximity bands to foreign territories (metres)
     */
    struct CollisionConfig {
        double safe_distance = 100.0;
        double caution_distance = 50.0;
        double warning_distance = 25.0;
        bool stop_on_violation = false; ///< Force-stop tracking on a live violation
    };

    struct TickConfig {
        std::chrono::milliseconds sampling_interval{2000};
    };

    struct Config {
        SpeedConfig speed;
        SamplerConfig sampler;
        ClosureConfig closure;
        IntersectionConfig intersection;
        ValidationConfig validation;
        CollisionConfig collision;
        TickConfig tick;
    };

    /**
     * @brief Reject configurations the engine cannot run with
     *
     * @param config Configuration to check
     * @throws std::invalid_argument naming the offending field
     */
    inline void validate_config(const Config &config) {
        const auto &s = config.speed;
        if (s.warning_speed_threshold <= 0.0)
            throw std::invalid_argument("speed.warning_speed_threshold must be positive");
        if (s.stop_speed_threshold < s.warning_speed_threshold)
            throw std::invalid_argument("speed.stop_speed_threshold must not be below the warning threshold");
        if (s.gps_drift_threshold < s.stop_speed_threshold)
            throw std::invalid_argument("speed.gps_drift_threshold must not be below the stop threshold");
        if (s.warning_consecutive_count < 1 || s.stop_consecutive_count < 1)
            throw std::invalid_argument("speed consecutive counts must be at least 1");

        if (config.sampler.min_distance_for_new_point < 0.0)
            throw std::invalid_argument("sampler.min_distance_for_new_point must not be negative");

        if (config.closure.minimum_path_points < 3)
            throw std::invalid_argument("closure.minimum_path_points must be at least 3");
        if (config.closure.closure_distance_threshold < 0.0)
            throw std::invalid_argument("closure.closure_distance_threshold must not be negative");

        const auto &i = config.intersection;
        if (i.min_segment_gap < 2)
            throw std::invalid_argument("intersection.min_segment_gap must be at least 2");
        if (i.intersection_noise_threshold < 0.0)
            throw std::invalid_argument("intersection.intersection_noise_threshold must not be negative");

        if (config.validation.minimum_total_distance < 0.0)
            throw std::invalid_argument("validation.minimum_total_distance must not be negative");
        if (config.validation.minimum_enclosed_area < 0.0)
            throw std::invalid_argument("validation.minimum_enclosed_area must not be negative");

        const auto &c = config.collision;
        if (!(c.safe_distance > c.caution_distance && c.caution_distance > c.warning_distance &&
              c.warning_distance >= 0.0))
            throw std::invalid_argument("collision distances must satisfy safe > caution > warning >= 0");

        if (config.tick.sampling_interval.count() <= 0)
            throw std::invalid_argument("tick.sampling_interval must be positive");
    }

} // namespace claimtrax
