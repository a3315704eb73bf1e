#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

#include <datapod/datapod.hpp>

#include "claimtrax/types.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace claimtrax {

    namespace utils {

        /// Mean Earth radius used for every spherical computation in the library
        constexpr double EARTH_RADIUS_M = 6371000.0;

        inline double to_radians(double degrees) { return degrees * M_PI / 180.0; }

        inline double to_degrees(double radians) { return radians * 180.0 / M_PI; }

        inline Coordinate make_coordinate(double latitude, double longitude) {
            return Coordinate{latitude, longitude, 0.0};
        }

        /**
         * @brief Great-circle (haversine) distance between two coordinates
         *
         * @param a First coordinate
         * @param b Second coordinate
         * @return Distance in metres
         */
        inline double great_circle_distance(const Coordinate &a, const Coordinate &b) {
            double lat1 = to_radians(a.latitude);
            double lat2 = to_radians(b.latitude);
            double d_lat = lat2 - lat1;
            double d_lon = to_radians(b.longitude - a.longitude);

            double h = std::sin(d_lat / 2.0) * std::sin(d_lat / 2.0) +
                       std::cos(lat1) * std::cos(lat2) * std::sin(d_lon / 2.0) * std::sin(d_lon / 2.0);
            h = std::clamp(h, 0.0, 1.0);

            return EARTH_RADIUS_M * 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
        }

        /**
         * @brief Point reached by travelling along a great circle
         *
         * @param origin Start coordinate
         * @param bearing_deg Initial bearing in degrees (0 = north, 90 = east)
         * @param distance_m Distance to travel in metres
         * @return Destination coordinate
         */
        inline Coordinate destination(const Coordinate &origin, double bearing_deg, double distance_m) {
            double delta = distance_m / EARTH_RADIUS_M;
            double theta = to_radians(bearing_deg);
            double lat1 = to_radians(origin.latitude);
            double lon1 = to_radians(origin.longitude);

            double lat2 = std::asin(std::sin(lat1) * std::cos(delta) + std::cos(lat1) * std::sin(delta) * std::cos(theta));
            double lon2 = lon1 + std::atan2(std::sin(theta) * std::sin(delta) * std::cos(lat1),
                                            std::cos(delta) - std::sin(lat1) * std::sin(lat2));

            return make_coordinate(to_degrees(lat2), to_degrees(lon2));
        }

        /**
         * @brief Orientation of three coordinates in the lon/lat plane
         *
         * @return 1 for counter-clockwise, -1 for clockwise, 0 for collinear
         */
        inline int ccw(const Coordinate &a, const Coordinate &b, const Coordinate &c) {
            double cross = (c.latitude - a.latitude) * (b.longitude - a.longitude) -
                           (b.latitude - a.latitude) * (c.longitude - a.longitude);
            if (cross > 0.0)
                return 1;
            if (cross < 0.0)
                return -1;
            return 0;
        }

        /**
         * @brief Check whether the lon/lat boxes spanned by two segments overlap
         */
        inline bool segment_boxes_overlap(const Coordinate &p1, const Coordinate &p2, const Coordinate &p3,
                                          const Coordinate &p4) {
            return std::max(p1.longitude, p2.longitude) >= std::min(p3.longitude, p4.longitude) &&
                   std::max(p3.longitude, p4.longitude) >= std::min(p1.longitude, p2.longitude) &&
                   std::max(p1.latitude, p2.latitude) >= std::min(p3.latitude, p4.latitude) &&
                   std::max(p3.latitude, p4.latitude) >= std::min(p1.latitude, p2.latitude);
        }

        /**
         * @brief CCW segment intersection test for (p1,p2) against (p3,p4)
         *
         * Segments with disjoint bounding boxes never intersect, even when nearly
         * collinear.
         */
        inline bool segments_intersect(const Coordinate &p1, const Coordinate &p2, const Coordinate &p3,
                                       const Coordinate &p4) {
            if (!segment_boxes_overlap(p1, p2, p3, p4))
                return false;
            return ccw(p1, p3, p4) != ccw(p2, p3, p4) && ccw(p1, p2, p3) != ccw(p1, p2, p4);
        }

        /**
         * @brief Smallest distance between any endpoint of one segment and any endpoint of the other
         */
        inline double min_endpoint_distance(const Coordinate &p1, const Coordinate &p2, const Coordinate &p3,
                                            const Coordinate &p4) {
            return std::min({great_circle_distance(p1, p3), great_circle_distance(p1, p4),
                             great_circle_distance(p2, p3), great_circle_distance(p2, p4)});
        }

        /**
         * @brief Ray-casting point-in-polygon test in the lon/lat plane
         *
         * @param point Query coordinate
         * @param polygon Polygon vertices, closing edge implied
         * @return true for an odd number of ray crossings
         */
        inline bool point_in_polygon(const Coordinate &point, const Path &polygon) {
            if (polygon.size() < 3)
                return false;

            bool inside = false;
            double x = point.longitude;
            double y = point.latitude;

            std::size_t j = polygon.size() - 1;
            for (std::size_t i = 0; i < polygon.size(); ++i) {
                double xi = polygon[i].longitude;
                double yi = polygon[i].latitude;
                double xj = polygon[j].longitude;
                double yj = polygon[j].latitude;

                bool crosses = ((yi > y) != (yj > y)) && (x < (xj - xi) * (y - yi) / (yj - yi) + xi);
                if (crosses)
                    inside = !inside;
                j = i;
            }
            return inside;
        }

        /**
         * @brief Bounding box of a path; empty paths give a zero box
         */
        inline BoundingBox bounding_box(const Path &path) {
            if (path.empty())
                return BoundingBox{};

            BoundingBox box{path.front().latitude, path.front().latitude, path.front().longitude,
                            path.front().longitude};
            for (const auto &c : path) {
                box.min_lat = std::min(box.min_lat, c.latitude);
                box.max_lat = std::max(box.max_lat, c.latitude);
                box.min_lon = std::min(box.min_lon, c.longitude);
                box.max_lon = std::max(box.max_lon, c.longitude);
            }
            return box;
        }

        /**
         * @brief Sum of great-circle segment lengths along the path (no closing edge)
         */
        inline double path_length(const Path &path) {
            double total = 0.0;
            for (std::size_t i = 1; i < path.size(); ++i) {
                total += great_circle_distance(path[i - 1], path[i]);
            }
            return total;
        }

    } // namespace utils

} // namespace claimtrax
