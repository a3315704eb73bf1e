#pragma once

#include <optional>
#include <string>

#include "claimtrax/config.hpp"
#include "claimtrax/territory.hpp"
#include "claimtrax/types.hpp"

namespace claimtrax {

    /**
     * @brief Collision and proximity tests of a path against other users' territories
     *
     * Unlike the self-intersection check, no noise discount is applied.
     */
    class CollisionDetector {
      public:
        explicit CollisionDetector(const CollisionConfig &config = CollisionConfig{});

        /**
         * @brief Check whether a single coordinate lies inside a foreign territory
         */
        CollisionResult check_point(const Coordinate &point, const TerritoryRoster &roster,
                                    const std::string &owner_id) const;

        /**
         * @brief Check every path segment against every foreign boundary edge, then the path tip for membership
         */
        CollisionResult check_path_crossing(const Path &path, const TerritoryRoster &roster,
                                            const std::string &owner_id) const;

        /**
         * @brief Great-circle distance from a coordinate to the nearest foreign vertex
         *
         * @return Distance in metres, empty if there is no foreign territory
         */
        std::optional<double> nearest_distance(const Coordinate &point, const TerritoryRoster &roster,
                                               const std::string &owner_id) const;

        /// Map a distance to its proximity band (never Violation)
        WarningLevel band(double distance_m) const;

        /**
         * @brief Full check used while tracking and at finalization
         *
         * A single-point path is only checked for membership. Longer paths are checked
         * for crossings and tip membership; without a violation the tip's distance to the
         * nearest foreign vertex selects the warning band.
         */
        CollisionResult check(const Path &path, const TerritoryRoster &roster, const std::string &owner_id) const;

      private:
        CollisionConfig config_;
    };

} // namespace claimtrax
