#include "claimtrax/session.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <utility>

namespace claimtrax {

    std::string format_duration(double seconds) {
        if (seconds < 0.0)
            seconds = 0.0;
        long total = static_cast<long>(seconds);
        std::ostringstream ss;
        ss << std::setfill('0') << std::setw(2) << total / 60 << ":" << std::setw(2) << total % 60;
        return ss.str();
    }

    std::string format_distance(double metres) {
        std::ostringstream ss;
        if (metres >= 1000.0)
            ss << std::fixed << std::setprecision(1) << metres / 1000.0 << " km";
        else
            ss << std::fixed << std::setprecision(0) << metres << " m";
        return ss.str();
    }

    TrackingSession::TrackingSession(const Config &config, std::string owner_id, const TerritoryRoster &roster,
                                     Journal *journal)
        : config_(config), owner_id_(std::move(owner_id)), roster_(roster), journal_(journal),
          speed_(config.speed, journal), sampler_(config.sampler, journal), closure_(config.closure, journal),
          intersections_(config.intersection, journal), collisions_(config.collision), validator_(config, journal) {
        validate_config(config_);
    }

    bool TrackingSession::start(Timestamp now) {
        if (state_ == SessionState::Tracking) {
            journal_log(journal_, LogLevel::Warning, "Start ignored, already tracking");
            return false;
        }

        reset();
        state_ = SessionState::Tracking;
        started_at_ = now;
        journal_log(journal_, LogLevel::Info, "Tracking started");
        return true;
    }

    FixOutcome TrackingSession::process_fix(const Fix &fix) {
        FixOutcome outcome;
        if (state_ != SessionState::Tracking)
            return outcome;

        outcome.verdict = speed_.classify(fix);

        if (outcome.verdict == FixVerdict::SpeedViolationFatal) {
            forced_stop_reason_ = ReasonCode::SpeedViolationFatal;
            outcome.stopped = stop(fix.timestamp);
            return outcome;
        }
        if (outcome.verdict != FixVerdict::Accepted)
            return outcome;

        outcome.recorded = sampler_.offer(fix.coordinate);
        if (outcome.recorded) {
            on_vertex_recorded();
            outcome.stopped = stop_if_violating(fix.timestamp);
        }
        return outcome;
    }

    std::optional<FinalizeOutcome> TrackingSession::tick(Timestamp now) {
        if (state_ != SessionState::Tracking || sampler_.empty())
            return std::nullopt;

        update_collision();
        return stop_if_violating(now);
    }

    std::optional<FinalizeOutcome> TrackingSession::stop_if_violating(Timestamp now) {
        if (!config_.collision.stop_on_violation || collision_.warning_level != WarningLevel::Violation)
            return std::nullopt;

        journal_log(journal_, LogLevel::Error, "Entered another territory, stopping tracking");
        forced_stop_reason_ = collision_.collision_type == CollisionType::PathCrossesTerritory
                                  ? ReasonCode::PathCrossesForeignTerritory
                                  : ReasonCode::PointInForeignTerritory;
        return stop(now);
    }

    void TrackingSession::on_vertex_recorded() {
        const Path &path = sampler_.path();

        closure_.update(path);

        if (!self_intersecting_ && intersections_.check_newest_segment(path))
            self_intersecting_ = true;

        update_collision();
    }

    void TrackingSession::update_collision() {
        CollisionResult next = collisions_.check(sampler_.path(), roster_, owner_id_);

        if (next.warning_level != collision_.warning_level) {
            std::ostringstream ss;
            ss << "Proximity " << warning_level_to_string(collision_.warning_level) << " -> "
               << warning_level_to_string(next.warning_level);
            if (next.nearest_distance_m && !next.has_collision)
                ss << " (" << std::fixed << std::setprecision(0) << *next.nearest_distance_m << " m)";

            LogLevel level = next.warning_level == WarningLevel::Violation ? LogLevel::Error
                             : next.warning_level == WarningLevel::Safe    ? LogLevel::Info
                                                                           : LogLevel::Warning;
            journal_log(journal_, level, ss.str());
        }
        collision_ = next;
    }

    std::optional<FinalizeOutcome> TrackingSession::stop(Timestamp now) {
        if (state_ != SessionState::Tracking) {
            journal_log(journal_, LogLevel::Warning, "Stop ignored, not tracking");
            return std::nullopt;
        }

        std::ostringstream ss;
        ss << "Tracking stopped with " << sampler_.size() << " points, " << format_distance(sampler_.total_distance());
        journal_log(journal_, LogLevel::Info, ss.str());

        state_ = SessionState::Finalizing;
        return finalize(now);
    }

    FinalizeOutcome TrackingSession::finalize(Timestamp now) {
        completed_at_ = now;

        // The roster may have been refreshed since the last vertex
        update_collision();

        FinalizeOutcome outcome;
        outcome.result = validator_.validate(sampler_.path(), sampler_.total_distance(), closure_.closed(), collision_);
        last_result_ = outcome.result;

        if (outcome.result.is_valid) {
            state_ = SessionState::Valid;
            outcome.record = claim_record();
        } else {
            state_ = SessionState::Invalid;
        }
        return outcome;
    }

    bool TrackingSession::resume() {
        if (state_ != SessionState::Invalid) {
            journal_log(journal_, LogLevel::Warning, "Resume ignored, session is not invalid");
            return false;
        }

        state_ = SessionState::Tracking;
        completed_at_.reset();
        forced_stop_reason_.reset();
        speed_.clear_alert();
        journal_log(journal_, LogLevel::Info, "Tracking resumed");
        return true;
    }

    void TrackingSession::reset() {
        state_ = SessionState::Idle;
        speed_.reset();
        sampler_.clear();
        closure_.reset();
        self_intersecting_ = false;
        collision_ = CollisionResult::safe();
        last_result_.reset();
        completed_at_.reset();
        forced_stop_reason_.reset();
        started_at_ = Timestamp{};
    }

    std::optional<TerritoryRecord> TrackingSession::claim_record() const {
        if (state_ != SessionState::Valid || !last_result_ || !completed_at_)
            return std::nullopt;
        return make_record(owner_id_, sampler_.path(), last_result_->computed_area_sqm, started_at_, *completed_at_);
    }

    SessionSnapshot TrackingSession::snapshot(Timestamp now) const {
        SessionSnapshot snap;
        snap.state = state_;
        snap.total_distance_m = sampler_.total_distance();
        if (state_ != SessionState::Idle) {
            Timestamp end = completed_at_ ? *completed_at_ : now;
            snap.duration_s = std::chrono::duration<double>(end - started_at_).count();
        }
        snap.speed_kmh = speed_.last_speed_kmh();
        snap.speed_alert = speed_.alert();
        snap.warning_level = collision_.warning_level;
        snap.nearest_distance_m = collision_.nearest_distance_m;
        snap.closed = closure_.closed();
        snap.self_intersecting = self_intersecting_;
        snap.point_count = sampler_.size();
        snap.path_version = sampler_.version();
        snap.forced_stop_reason = forced_stop_reason_;
        if (last_result_) {
            snap.last_reason = last_result_->failure_reason;
            snap.area_sqm = last_result_->computed_area_sqm;
        }
        return snap;
    }

} // namespace claimtrax
