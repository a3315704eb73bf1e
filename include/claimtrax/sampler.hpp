#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>

#include "claimtrax/config.hpp"
#include "claimtrax/journal.hpp"
#include "claimtrax/types.hpp"
#include "claimtrax/utils/utils.hpp"

namespace claimtrax {

    /**
     * @brief Distance-gated recorder turning accepted fixes into polygon vertices
     *
     * The gate keeps the vertex count proportional to the walked distance rather than
     * to the fix rate, which bounds the later quadratic checks.
     */
    class PathSampler {
      public:
        inline explicit PathSampler(const SamplerConfig &config = SamplerConfig{}, Journal *journal = nullptr)
            : config_(config), journal_(journal) {}

        /**
         * @brief Record the coordinate if it is far enough from the last vertex
         *
         * @param coordinate Coordinate of an accepted fix
         * @return true if a vertex was appended
         */
        inline bool offer(const Coordinate &coordinate) {
            if (!path_.empty()) {
                double step = utils::great_circle_distance(path_.back(), coordinate);
                if (step < config_.min_distance_for_new_point)
                    return false;
                total_distance_ += step;
            }

            path_.push_back(coordinate);
            ++version_;

            std::ostringstream ss;
            ss << "Recorded vertex #" << path_.size() << " (" << std::fixed << std::setprecision(6)
               << coordinate.latitude << ", " << coordinate.longitude << ")";
            journal_log(journal_, LogLevel::Info, ss.str());
            return true;
        }

        inline void clear() {
            path_.clear();
            total_distance_ = 0.0;
            ++version_;
        }

        inline const Path &path() const { return path_; }
        inline std::size_t size() const { return path_.size(); }
        inline bool empty() const { return path_.empty(); }
        inline double total_distance() const { return total_distance_; }

        /// Bumped on every change so observers can detect updates cheaply
        inline std::uint64_t version() const { return version_; }

      private:
        SamplerConfig config_;
        Journal *journal_;
        Path path_;
        double total_distance_ = 0.0;
        std::uint64_t version_ = 0;
    };

} // namespace claimtrax
