#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "claimtrax/closure.hpp"
#include "claimtrax/collision.hpp"
#include "claimtrax/config.hpp"
#include "claimtrax/intersect.hpp"
#include "claimtrax/journal.hpp"
#include "claimtrax/sampler.hpp"
#include "claimtrax/speed.hpp"
#include "claimtrax/territory.hpp"
#include "claimtrax/types.hpp"
#include "claimtrax/validate.hpp"

namespace claimtrax {

    enum class SessionState { Idle, Tracking, Finalizing, Valid, Invalid };

    inline const char *session_state_to_string(SessionState state) {
        switch (state) {
        case SessionState::Idle:
            return "idle";
        case SessionState::Tracking:
            return "tracking";
        case SessionState::Finalizing:
            return "finalizing";
        case SessionState::Valid:
            return "valid";
        case SessionState::Invalid:
            return "invalid";
        }
        return "unknown";
    }

    /**
     * @brief Read-only projection of a session for presentation code
     */
    struct SessionSnapshot {
        SessionState state = SessionState::Idle;
        double total_distance_m = 0.0;
        double duration_s = 0.0;
        double speed_kmh = 0.0;
        SpeedAlert speed_alert = SpeedAlert::None;
        WarningLevel warning_level = WarningLevel::Safe;
        std::optional<double> nearest_distance_m;
        bool closed = false;
        bool self_intersecting = false;
        std::size_t point_count = 0;
        std::uint64_t path_version = 0;
        std::optional<ReasonCode> last_reason;        ///< Failure reason of the last finalization
        std::optional<ReasonCode> forced_stop_reason; ///< Why tracking was stopped automatically
        double area_sqm = 0.0;

        /// Danger/Violation proximity or a failed validation must be resolved before claiming
        bool blocking() const { return is_blocking(warning_level) || state == SessionState::Invalid; }
    };

    /// Format a duration as mm:ss
    std::string format_duration(double seconds);

    /// Format a distance as "123 m" or "1.2 km"
    std::string format_distance(double metres);

    struct FinalizeOutcome {
        ValidationResult result;
        std::optional<TerritoryRecord> record; ///< Present only for a valid claim
    };

    struct FixOutcome {
        FixVerdict verdict = FixVerdict::Ignored;
        bool recorded = false;                  ///< A new vertex was appended
        std::optional<FinalizeOutcome> stopped; ///< Set when this fix forced the session to stop
    };

    /**
     * @brief One user's claim-tracking session
     *
     * Not thread-safe; TrackingService serializes access. The roster is borrowed and
     * must outlive the session.
     *
     * States: Idle -> Tracking -> Finalizing -> {Valid, Invalid}. Invalid sessions can
     * be resumed; any finished session can be restarted or reset.
     */
    class TrackingSession {
      public:
        TrackingSession(const Config &config, std::string owner_id, const TerritoryRoster &roster,
                        Journal *journal = nullptr);

        /**
         * @brief Begin a new session, discarding any finished one
         *
         * @return false if a session is already tracking
         */
        bool start(Timestamp now);

        /**
         * @brief Feed one fix through speed filter, sampler and live checks
         */
        FixOutcome process_fix(const Fix &fix);

        /**
         * @brief Periodic re-evaluation between fixes
         *
         * Re-checks the current path tip against the roster. The speed filter and the
         * sampler are left untouched; only delivered fixes move them.
         *
         * @return Outcome if a live violation forced the session to stop
         */
        std::optional<FinalizeOutcome> tick(Timestamp now);

        /**
         * @brief Stop tracking and finalize
         *
         * @return Outcome, or empty if the session was not tracking
         */
        std::optional<FinalizeOutcome> stop(Timestamp now);

        /**
         * @brief Continue tracking after an invalid finalization, keeping the path
         *
         * @return false unless the session is Invalid
         */
        bool resume();

        /// Drop everything and return to Idle
        void reset();

        SessionSnapshot snapshot(Timestamp now) const;

        /// Record for the persistence collaborator, only after a valid finalization
        std::optional<TerritoryRecord> claim_record() const;

        SessionState state() const { return state_; }
        bool tracking() const { return state_ == SessionState::Tracking; }
        const Path &path() const { return sampler_.path(); }
        double total_distance() const { return sampler_.total_distance(); }
        bool closed() const { return closure_.closed(); }
        bool self_intersecting() const { return self_intersecting_; }
        int consecutive_overspeed_count() const { return speed_.consecutive_overspeed_count(); }
        const std::optional<Fix> &last_recorded_fix() const { return speed_.last_recorded_fix(); }
        const CollisionResult &collision() const { return collision_; }
        const std::optional<ValidationResult> &last_result() const { return last_result_; }
        const std::optional<ReasonCode> &forced_stop_reason() const { return forced_stop_reason_; }
        Timestamp started_at() const { return started_at_; }
        const std::string &owner_id() const { return owner_id_; }

      private:
        void on_vertex_recorded();
        void update_collision();
        std::optional<FinalizeOutcome> stop_if_violating(Timestamp now);
        FinalizeOutcome finalize(Timestamp now);

        Config config_;
        std::string owner_id_;
        const TerritoryRoster &roster_;
        Journal *journal_;

        SpeedFilter speed_;
        PathSampler sampler_;
        ClosureDetector closure_;
        SelfIntersectionDetector intersections_;
        CollisionDetector collisions_;
        Validator validator_;

        SessionState state_ = SessionState::Idle;
        Timestamp started_at_{};
        std::optional<Timestamp> completed_at_;
        bool self_intersecting_ = false;
        CollisionResult collision_;
        std::optional<ValidationResult> last_result_;
        std::optional<ReasonCode> forced_stop_reason_;
    };

} // namespace claimtrax
