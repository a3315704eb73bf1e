#include "claimtrax/intersect.hpp"

#include <sstream>

#include "claimtrax/utils/utils.hpp"

namespace claimtrax {

    SelfIntersectionDetector::SelfIntersectionDetector(const IntersectionConfig &config, Journal *journal)
        : config_(config), journal_(journal) {}

    bool SelfIntersectionDetector::real_crossing(const Coordinate &p1, const Coordinate &p2, const Coordinate &p3,
                                                 const Coordinate &p4) const {
        if (!utils::segments_intersect(p1, p2, p3, p4))
            return false;

        // Crossings between segments this close together are GPS jitter
        return utils::min_endpoint_distance(p1, p2, p3, p4) >= config_.intersection_noise_threshold;
    }

    bool SelfIntersectionDetector::check_newest_segment(const Path &path) const {
        if (path.size() < 3)
            return false;

        const std::size_t newest = path.size() - 2;
        if (newest <= config_.incremental_skip_tail_count)
            return false;

        const Coordinate &p1 = path[newest];
        const Coordinate &p2 = path[newest + 1];
        const std::size_t last_candidate = newest - config_.incremental_skip_tail_count;

        for (std::size_t i = 0; i < last_candidate; ++i) {
            if (real_crossing(p1, p2, path[i], path[i + 1])) {
                std::ostringstream ss;
                ss << "Live check: segment " << newest << " crosses segment " << i;
                journal_log(journal_, LogLevel::Warning, ss.str());
                return true;
            }
        }
        return false;
    }

    std::optional<SegmentCrossing> SelfIntersectionDetector::find_crossing(const Path &path) const {
        if (path.size() < 4)
            return std::nullopt;

        const std::size_t segment_count = path.size() - 1;

        for (std::size_t i = 0; i < segment_count; ++i) {
            for (std::size_t j = i + config_.min_segment_gap; j < segment_count; ++j) {
                bool head = i < config_.skip_head_count;
                bool tail = j + config_.skip_tail_count >= segment_count;
                if (head && tail)
                    continue;

                if (real_crossing(path[i], path[i + 1], path[j], path[j + 1])) {
                    std::ostringstream ss;
                    ss << "Self-intersection between segments " << i << " and " << j;
                    journal_log(journal_, LogLevel::Error, ss.str());
                    return SegmentCrossing{i, j};
                }
            }
        }
        return std::nullopt;
    }

} // namespace claimtrax
