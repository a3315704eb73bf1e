#pragma once

#include <iomanip>
#include <sstream>

#include "claimtrax/config.hpp"
#include "claimtrax/journal.hpp"
#include "claimtrax/types.hpp"
#include "claimtrax/utils/utils.hpp"

namespace claimtrax {

    /**
     * @brief Check whether a path returns to its start
     *
     * @param path Recorded vertices
     * @param config Minimum vertex count and closing distance
     * @return true if enough vertices exist and the ends are within the threshold
     */
    inline bool is_closed(const Path &path, const ClosureConfig &config) {
        if (path.size() < 2 || path.size() < config.minimum_path_points)
            return false;
        return utils::great_circle_distance(path.front(), path.back()) <= config.closure_distance_threshold;
    }

    /**
     * @brief Incremental closure tracker; once closed it stays closed until reset
     */
    class ClosureDetector {
      public:
        inline explicit ClosureDetector(const ClosureConfig &config = ClosureConfig{}, Journal *journal = nullptr)
            : config_(config), journal_(journal) {}

        /**
         * @brief Re-evaluate after a new vertex
         *
         * @return Current closure state
         */
        inline bool update(const Path &path) {
            if (closed_)
                return true;

            if (is_closed(path, config_)) {
                closed_ = true;
                std::ostringstream ss;
                ss << "Loop closed, " << std::fixed << std::setprecision(1)
                   << utils::great_circle_distance(path.front(), path.back()) << " m from start";
                journal_log(journal_, LogLevel::Success, ss.str());
            }
            return closed_;
        }

        inline bool closed() const { return closed_; }
        inline void reset() { closed_ = false; }

      private:
        ClosureConfig config_;
        Journal *journal_;
        bool closed_ = false;
    };

} // namespace claimtrax
