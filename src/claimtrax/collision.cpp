#include "claimtrax/collision.hpp"

#include <algorithm>
#include <limits>

#include "claimtrax/utils/utils.hpp"

namespace claimtrax {

    namespace {

        BoundingBox point_box(const Coordinate &c) {
            return BoundingBox{c.latitude, c.latitude, c.longitude, c.longitude};
        }

        BoundingBox segment_box(const Coordinate &a, const Coordinate &b) {
            return BoundingBox{std::min(a.latitude, b.latitude), std::max(a.latitude, b.latitude),
                               std::min(a.longitude, b.longitude), std::max(a.longitude, b.longitude)};
        }

    } // namespace

    CollisionDetector::CollisionDetector(const CollisionConfig &config) : config_(config) {}

    CollisionResult CollisionDetector::check_point(const Coordinate &point, const TerritoryRoster &roster,
                                                   const std::string &owner_id) const {
        for (const Territory *territory : roster.foreign_near(owner_id, point_box(point))) {
            if (utils::point_in_polygon(point, territory->polygon))
                return CollisionResult::violation(CollisionType::PointInTerritory);
        }
        return CollisionResult::safe();
    }

    CollisionResult CollisionDetector::check_path_crossing(const Path &path, const TerritoryRoster &roster,
                                                           const std::string &owner_id) const {
        if (path.size() < 2)
            return CollisionResult::safe();

        for (std::size_t i = 0; i + 1 < path.size(); ++i) {
            const Coordinate &a = path[i];
            const Coordinate &b = path[i + 1];

            for (const Territory *territory : roster.foreign_near(owner_id, segment_box(a, b))) {
                const Path &polygon = territory->polygon;
                if (polygon.size() < 3)
                    continue;

                for (std::size_t j = 0; j < polygon.size(); ++j) {
                    const Coordinate &edge_start = polygon[j];
                    const Coordinate &edge_end = polygon[(j + 1) % polygon.size()];
                    if (utils::segments_intersect(a, b, edge_start, edge_end))
                        return CollisionResult::violation(CollisionType::PathCrossesTerritory);
                }
            }
        }

        return check_point(path.back(), roster, owner_id);
    }

    std::optional<double> CollisionDetector::nearest_distance(const Coordinate &point, const TerritoryRoster &roster,
                                                              const std::string &owner_id) const {
        double best = std::numeric_limits<double>::infinity();
        for (const Territory *territory : roster.foreign(owner_id)) {
            for (const auto &vertex : territory->polygon) {
                best = std::min(best, utils::great_circle_distance(point, vertex));
            }
        }
        if (best == std::numeric_limits<double>::infinity())
            return std::nullopt;
        return best;
    }

    WarningLevel CollisionDetector::band(double distance_m) const {
        if (distance_m > config_.safe_distance)
            return WarningLevel::Safe;
        if (distance_m > config_.caution_distance)
            return WarningLevel::Caution;
        if (distance_m > config_.warning_distance)
            return WarningLevel::Warning;
        return WarningLevel::Danger;
    }

    CollisionResult CollisionDetector::check(const Path &path, const TerritoryRoster &roster,
                                             const std::string &owner_id) const {
        if (path.empty())
            return CollisionResult::safe();

        if (path.size() == 1) {
            CollisionResult start = check_point(path.front(), roster, owner_id);
            if (start.has_collision)
                return start;
        } else {
            CollisionResult crossing = check_path_crossing(path, roster, owner_id);
            if (crossing.has_collision)
                return crossing;
        }

        auto nearest = nearest_distance(path.back(), roster, owner_id);
        if (!nearest)
            return CollisionResult::safe();
        return CollisionResult::banded(band(*nearest), *nearest);
    }

} // namespace claimtrax
