#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

namespace claimtrax {

    using Clock = std::chrono::system_clock;
    using Timestamp = Clock::time_point;

    /// Geographic position in degrees. Altitude is carried by datapod::Geo but always 0 here.
    using Coordinate = datapod::Geo;

    /// Ordered polygon vertices; order defines winding and adjacency
    using Path = std::vector<Coordinate>;

    /**
     * @brief Raw positional fix as delivered by the platform location service
     */
    struct Fix {
        Coordinate coordinate;
        Timestamp timestamp;
        std::optional<double> horizontal_accuracy; ///< Metres, if the platform reports it
    };

    /**
     * @brief Minimal axis-aligned rectangle in latitude/longitude
     */
    struct BoundingBox {
        double min_lat = 0.0;
        double max_lat = 0.0;
        double min_lon = 0.0;
        double max_lon = 0.0;

        bool contains(const Coordinate &c) const {
            return c.latitude >= min_lat && c.latitude <= max_lat && c.longitude >= min_lon &&
                   c.longitude <= max_lon;
        }

        Coordinate center() const { return Coordinate{(min_lat + max_lat) / 2.0, (min_lon + max_lon) / 2.0, 0.0}; }

        /**
         * @brief Planar box for spatial indexing (x = longitude, y = latitude)
         */
        datapod::AABB to_aabb() const {
            return datapod::AABB{datapod::Point{min_lon, min_lat, 0.0}, datapod::Point{max_lon, max_lat, 0.0}};
        }
    };

    /**
     * @brief Distance band to the nearest foreign territory, totally ordered
     */
    enum class WarningLevel {
        Safe = 0,
        Caution = 1,
        Warning = 2,
        Danger = 3,
        Violation = 4,
    };

    /// Danger and Violation block a claim in the UI; Caution and Warning are advisory
    inline bool is_blocking(WarningLevel level) { return level >= WarningLevel::Danger; }

    inline const char *warning_level_to_string(WarningLevel level) {
        switch (level) {
        case WarningLevel::Safe:
            return "safe";
        case WarningLevel::Caution:
            return "caution";
        case WarningLevel::Warning:
            return "warning";
        case WarningLevel::Danger:
            return "danger";
        case WarningLevel::Violation:
            return "violation";
        }
        return "unknown";
    }

    enum class CollisionType {
        PointInTerritory,     ///< A path point lies inside a foreign polygon
        PathCrossesTerritory, ///< A path segment crosses a foreign boundary
    };

    /**
     * @brief Why a claim could not be finalized
     */
    enum class ReasonCode {
        InsufficientPoints,
        InsufficientDistance,
        PathNotClosed,
        SelfIntersection,
        InsufficientArea,
        PointInForeignTerritory,
        PathCrossesForeignTerritory,
        SpeedViolationFatal,
    };

    inline const char *reason_to_string(ReasonCode reason) {
        switch (reason) {
        case ReasonCode::InsufficientPoints:
            return "insufficient_points";
        case ReasonCode::InsufficientDistance:
            return "insufficient_distance";
        case ReasonCode::PathNotClosed:
            return "path_not_closed";
        case ReasonCode::SelfIntersection:
            return "self_intersection";
        case ReasonCode::InsufficientArea:
            return "insufficient_area";
        case ReasonCode::PointInForeignTerritory:
            return "point_in_foreign_territory";
        case ReasonCode::PathCrossesForeignTerritory:
            return "path_crosses_foreign_territory";
        case ReasonCode::SpeedViolationFatal:
            return "speed_violation_fatal";
        }
        return "unknown";
    }

    /**
     * @brief Verdict of one finalize attempt
     */
    struct ValidationResult {
        bool is_valid = false;
        std::optional<ReasonCode> failure_reason;
        double computed_area_sqm = 0.0;

        static ValidationResult valid(double area_sqm) { return ValidationResult{true, std::nullopt, area_sqm}; }
        static ValidationResult invalid(ReasonCode reason, double area_sqm = 0.0) {
            return ValidationResult{false, reason, area_sqm};
        }
    };

    struct CollisionResult {
        bool has_collision = false;
        std::optional<CollisionType> collision_type;
        WarningLevel warning_level = WarningLevel::Safe;
        std::optional<double> nearest_distance_m;

        static CollisionResult safe() { return CollisionResult{}; }

        static CollisionResult violation(CollisionType type) {
            return CollisionResult{true, type, WarningLevel::Violation, 0.0};
        }

        static CollisionResult banded(WarningLevel level, double distance_m) {
            return CollisionResult{false, std::nullopt, level, distance_m};
        }
    };

    /**
     * @brief A claimed polygon as pulled from the persistence collaborator
     */
    struct Territory {
        std::string id;
        std::string owner_id;
        Path polygon;
        double area_sqm = 0.0;
        BoundingBox bounding_box;
        Timestamp created_at{};
        bool active = true;
    };

    /**
     * @brief Finalized claim handed to the persistence collaborator
     */
    struct TerritoryRecord {
        std::string owner_id;
        Path ordered_points;
        double area_sqm = 0.0;
        BoundingBox bounding_box;
        std::size_t point_count = 0;
        Timestamp started_at{};
        Timestamp completed_at{};

        /**
         * @brief Render the polygon as WKT, longitude first, ring explicitly closed
         */
        std::string to_wkt() const;
    };

} // namespace claimtrax
