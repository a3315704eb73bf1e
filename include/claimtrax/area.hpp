#pragma once

#include <cmath>
#include <cstddef>

#include "claimtrax/types.hpp"
#include "claimtrax/utils/utils.hpp"

namespace claimtrax {

    /**
     * @brief Enclosed area of a closed path on a spherical Earth
     *
     * Shoelace formula with a spherical correction term, summed over consecutive
     * vertex pairs with the closing edge last -> first:
     * area = |R^2 * sum (lon[i+1] - lon[i]) * (2 + sin(lat[i]) + sin(lat[i+1]))| / 2
     *
     * The result does not depend on winding direction or the starting vertex.
     *
     * @param path Polygon vertices in degrees, closing edge implied
     * @return Area in square metres, 0 for fewer than 3 vertices
     */
    inline double spherical_area(const Path &path) {
        if (path.size() < 3)
            return 0.0;

        double sum = 0.0;
        const std::size_t n = path.size();
        for (std::size_t i = 0; i < n; ++i) {
            const Coordinate &a = path[i];
            const Coordinate &b = path[(i + 1) % n];
            double d_lon = utils::to_radians(b.longitude - a.longitude);
            sum += d_lon * (2.0 + std::sin(utils::to_radians(a.latitude)) + std::sin(utils::to_radians(b.latitude)));
        }

        return std::abs(sum * utils::EARTH_RADIUS_M * utils::EARTH_RADIUS_M) / 2.0;
    }

} // namespace claimtrax
