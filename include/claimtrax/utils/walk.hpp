#pragma once

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <vector>

#include <concord/frame/convert.hpp>
#include <datapod/datapod.hpp>

#include "claimtrax/types.hpp"
#include "claimtrax/utils/utils.hpp"

namespace claimtrax {
    namespace walk {

        /**
         * @brief Convert a local ENU point (metres) to a WGS84 coordinate
         */
        inline Coordinate enu_to_coordinate(const datapod::Point &enu_pt, const datapod::Geo &datum) {
            concord::frame::ENU enu{enu_pt.x, enu_pt.y, 0.0, datum};
            auto wgs = concord::frame::to_wgs(enu);
            return utils::make_coordinate(wgs.latitude, wgs.longitude);
        }

        /**
         * @brief Convert a local ENU polyline to a path around the datum
         */
        inline Path enu_to_path(const std::vector<datapod::Point> &points, const datapod::Geo &datum) {
            Path path;
            path.reserve(points.size());
            for (const auto &p : points)
                path.push_back(enu_to_coordinate(p, datum));
            return path;
        }

        /**
         * @brief Densify a polyline so no step is longer than max_step metres
         *
         * Distances are taken along the ENU plane; the last point is kept.
         */
        inline std::vector<datapod::Point> densify(const std::vector<datapod::Point> &points, double max_step) {
            if (max_step <= 0.0)
                throw std::invalid_argument("max_step must be positive");
            if (points.size() < 2)
                return points;

            std::vector<datapod::Point> out;
            out.push_back(points.front());
            for (std::size_t i = 1; i < points.size(); ++i) {
                const auto &a = points[i - 1];
                const auto &b = points[i];
                double len = std::hypot(b.x - a.x, b.y - a.y);
                auto steps = static_cast<std::size_t>(std::ceil(len / max_step));
                for (std::size_t k = 1; k <= steps; ++k) {
                    double t = static_cast<double>(k) / static_cast<double>(steps);
                    out.push_back(datapod::Point{a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t, 0.0});
                }
            }
            return out;
        }

        /**
         * @brief Timestamp each vertex of a path as if walked at constant speed
         *
         * @param path Vertices in walking order
         * @param speed_kmh Walking speed
         * @param start Time of the first fix
         */
        inline std::vector<Fix> timed_fixes(const Path &path, double speed_kmh, Timestamp start) {
            if (speed_kmh <= 0.0)
                throw std::invalid_argument("speed_kmh must be positive");

            double metres_per_second = speed_kmh / 3.6;
            std::vector<Fix> fixes;
            fixes.reserve(path.size());
            Timestamp t = start;
            for (std::size_t i = 0; i < path.size(); ++i) {
                if (i > 0) {
                    double seconds = utils::great_circle_distance(path[i - 1], path[i]) / metres_per_second;
                    t += std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
                }
                fixes.push_back(Fix{path[i], t, std::nullopt});
            }
            return fixes;
        }

    } // namespace walk
} // namespace claimtrax
