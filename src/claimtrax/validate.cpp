#include "claimtrax/validate.hpp"

#include <iomanip>
#include <sstream>

#include "claimtrax/area.hpp"
#include "claimtrax/closure.hpp"

namespace claimtrax {

    namespace {

        ValidationResult reject(Journal *journal, ReasonCode reason, const std::string &detail, double area = 0.0) {
            journal_log(journal, LogLevel::Error,
                        std::string("Validation failed: ") + reason_to_string(reason) + " (" + detail + ")");
            return ValidationResult::invalid(reason, area);
        }

        std::string fixed(double value, int precision) {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(precision) << value;
            return ss.str();
        }

    } // namespace

    Validator::Validator(const Config &config, Journal *journal)
        : config_(config), intersections_(config.intersection, journal), journal_(journal) {}

    ValidationResult Validator::validate(const Path &path, double total_distance, bool closed,
                                         const CollisionResult &collision) const {
        if (collision.warning_level == WarningLevel::Violation) {
            ReasonCode reason = collision.collision_type == CollisionType::PathCrossesTerritory
                                    ? ReasonCode::PathCrossesForeignTerritory
                                    : ReasonCode::PointInForeignTerritory;
            return reject(journal_, reason, "claim overlaps another territory");
        }

        if (path.size() < config_.closure.minimum_path_points) {
            return reject(journal_, ReasonCode::InsufficientPoints,
                          std::to_string(path.size()) + "/" + std::to_string(config_.closure.minimum_path_points) +
                              " points");
        }

        if (total_distance < config_.validation.minimum_total_distance) {
            return reject(journal_, ReasonCode::InsufficientDistance,
                          fixed(total_distance, 0) + " m < " + fixed(config_.validation.minimum_total_distance, 0) +
                              " m");
        }

        if (!closed && !is_closed(path, config_.closure))
            return reject(journal_, ReasonCode::PathNotClosed, "end is too far from start");

        if (intersections_.has_self_intersection(path))
            return reject(journal_, ReasonCode::SelfIntersection, "path crosses itself");

        double area = spherical_area(path);
        if (area < config_.validation.minimum_enclosed_area) {
            return reject(journal_, ReasonCode::InsufficientArea,
                          fixed(area, 0) + " m2 < " + fixed(config_.validation.minimum_enclosed_area, 0) + " m2", area);
        }

        journal_log(journal_, LogLevel::Success, "Validation passed, area " + fixed(area, 0) + " m2");
        return ValidationResult::valid(area);
    }

} // namespace claimtrax
