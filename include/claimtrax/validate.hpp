#pragma once

#include "claimtrax/config.hpp"
#include "claimtrax/intersect.hpp"
#include "claimtrax/journal.hpp"
#include "claimtrax/types.hpp"

namespace claimtrax {

    /**
     * @brief Ordered, short-circuiting batch validation of a finished path
     *
     * Pipeline:
     * 0. collision gate (a Violation always wins)
     * 1. vertex count
     * 2. travelled distance
     * 3. closure
     * 4. authoritative self-intersection
     * 5. enclosed area
     */
    class Validator {
      public:
        explicit Validator(const Config &config = Config{}, Journal *journal = nullptr);

        /**
         * @brief Run the pipeline
         *
         * @param path Recorded vertices
         * @param total_distance Distance travelled along the recorded vertices (metres)
         * @param closed Closure flag observed while tracking
         * @param collision Result of the collision check on the final path
         * @return Verdict with the first failing reason; the area is set once the
         *         self-intersection check has passed
         */
        ValidationResult validate(const Path &path, double total_distance, bool closed,
                                  const CollisionResult &collision = CollisionResult::safe()) const;

      private:
        Config config_;
        SelfIntersectionDetector intersections_;
        Journal *journal_;
    };

} // namespace claimtrax
