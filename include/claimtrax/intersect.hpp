#pragma once

#include <cstddef>
#include <optional>

#include "claimtrax/config.hpp"
#include "claimtrax/journal.hpp"
#include "claimtrax/types.hpp"

namespace claimtrax {

    /**
     * @brief Indices of two crossing path segments; segment i runs from vertex i to i + 1
     */
    struct SegmentCrossing {
        std::size_t first;
        std::size_t second;
    };

    /**
     * @brief Noise-tolerant self-intersection detector
     *
     * Two checks share the same crossing predicate:
     * - check_newest_segment() tests only the latest segment and is cheap enough to run
     *   on every recorded vertex for live feedback;
     * - find_crossing() compares every pair of non-adjacent segments and is the
     *   authoritative check at finalization.
     *
     * Crossings whose segments have endpoints closer than the noise threshold are
     * treated as GPS jitter. Head and tail segments are not compared with each other so
     * that a loop closing near its start is not mistaken for a crossing.
     */
    class SelfIntersectionDetector {
      public:
        explicit SelfIntersectionDetector(const IntersectionConfig &config = IntersectionConfig{},
                                          Journal *journal = nullptr);

        /**
         * @brief Test the newest segment against earlier ones
         *
         * @param path Recorded vertices, newest last
         * @return true if the newest segment crosses an earlier segment beyond the noise threshold
         */
        bool check_newest_segment(const Path &path) const;

        /**
         * @brief Exhaustive pairwise check of the whole path
         *
         * @param path Recorded vertices
         * @return First real crossing found, if any
         */
        std::optional<SegmentCrossing> find_crossing(const Path &path) const;

        bool has_self_intersection(const Path &path) const { return find_crossing(path).has_value(); }

        const IntersectionConfig &config() const { return config_; }

      private:
        bool real_crossing(const Coordinate &p1, const Coordinate &p2, const Coordinate &p3,
                           const Coordinate &p4) const;

        IntersectionConfig config_;
        Journal *journal_;
    };

} // namespace claimtrax
