#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "claimtrax/journal.hpp"
#include "claimtrax/types.hpp"

namespace claimtrax {

    /**
     * @brief Generate a random (v4) territory identifier
     */
    std::string generate_territory_id();

    /**
     * @brief Compare owner ids the way the backend stores them (case-insensitive)
     */
    bool same_owner(const std::string &a, const std::string &b);

    /**
     * @brief Create a Territory with computed area and bounding box
     *
     * @param owner_id Owner of the claim
     * @param polygon Polygon vertices
     * @param created_at Creation time
     * @param id Optional id (generated if empty)
     */
    Territory make_territory(const std::string &owner_id, const Path &polygon, Timestamp created_at,
                             std::string id = "");

    /**
     * @brief Build the outbound record of a finalized claim
     */
    TerritoryRecord make_record(const std::string &owner_id, const Path &path, double area_sqm, Timestamp started_at,
                                Timestamp completed_at);

    /**
     * @brief Read-mostly set of claimed territories with a bounding-box index
     *
     * Refreshed by replacement from the persistence collaborator. Soft-deleted
     * territories stay in the roster but are skipped by foreign().
     */
    class TerritoryRoster {
      public:
        TerritoryRoster() = default;
        explicit TerritoryRoster(std::vector<Territory> territories);

        /// Replace the whole roster (pull refresh)
        void replace(std::vector<Territory> territories);

        void add(Territory territory);

        /**
         * @brief Soft-delete a territory by id
         *
         * @return false if no territory has that id
         */
        bool deactivate(const std::string &id);

        /**
         * @brief Active territories not owned by the given user
         */
        std::vector<const Territory *> foreign(const std::string &owner_id) const;

        /**
         * @brief Active foreign territories whose bounding box intersects the query box
         */
        std::vector<const Territory *> foreign_near(const std::string &owner_id, const BoundingBox &box) const;

        const std::vector<Territory> &territories() const { return territories_; }
        std::size_t size() const { return territories_.size(); }
        bool empty() const { return territories_.empty(); }

      private:
        void rebuild_index();

        std::vector<Territory> territories_;
        datapod::RTree<std::size_t> index_;
    };

} // namespace claimtrax
