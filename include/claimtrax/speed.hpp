#pragma once

#include <chrono>
#include <iomanip>
#include <optional>
#include <sstream>

#include "claimtrax/config.hpp"
#include "claimtrax/journal.hpp"
#include "claimtrax/types.hpp"
#include "claimtrax/utils/utils.hpp"

namespace claimtrax {

    /**
     * @brief Classification of a single incoming fix
     */
    enum class FixVerdict {
        Accepted,            ///< Plausible walking movement, forwarded to the sampler
        GpsDrift,            ///< Implausible jump, discarded without touching the overspeed counter
        Overspeed,           ///< Too fast, rejected silently while the counter builds up
        SpeedWarning,        ///< Sustained overspeed, rejected and surfaced to the user
        SpeedViolationFatal, ///< Sustained fast movement, the session must stop
        Ignored,             ///< Delivered while no session was tracking
    };

    inline const char *fix_verdict_to_string(FixVerdict verdict) {
        switch (verdict) {
        case FixVerdict::Accepted:
            return "accepted";
        case FixVerdict::GpsDrift:
            return "gps_drift";
        case FixVerdict::Overspeed:
            return "overspeed";
        case FixVerdict::SpeedWarning:
            return "speed_warning";
        case FixVerdict::SpeedViolationFatal:
            return "speed_violation_fatal";
        case FixVerdict::Ignored:
            return "ignored";
        }
        return "unknown";
    }

    enum class SpeedAlert { None, Warning, Fatal };

    /**
     * @brief Speed and drift classifier
     *
     * Single noisy jumps are classified as drift and never count toward the
     * overspeed counter; only consecutive overspeed fixes escalate to a warning or
     * a forced stop.
     */
    class SpeedFilter {
      public:
        inline explicit SpeedFilter(const SpeedConfig &config = SpeedConfig{}, Journal *journal = nullptr)
            : config_(config), journal_(journal) {}

        /**
         * @brief Classify a fix against the previously recorded one
         *
         * @param fix Incoming fix
         * @return Verdict; only FixVerdict::Accepted may be forwarded to sampling
         */
        inline FixVerdict classify(const Fix &fix) {
            if (!last_fix_) {
                last_fix_ = fix;
                last_speed_kmh_ = 0.0;
                return FixVerdict::Accepted;
            }

            double elapsed = std::chrono::duration<double>(fix.timestamp - last_fix_->timestamp).count();
            if (elapsed <= 0.0)
                return FixVerdict::Accepted;

            double distance = utils::great_circle_distance(last_fix_->coordinate, fix.coordinate);
            double speed_kmh = distance / elapsed * 3.6;

            if (speed_kmh > config_.gps_drift_threshold) {
                journal_log(journal_, LogLevel::Warning,
                            "GPS drift detected at " + format_speed(speed_kmh) + ", fix ignored");
                return FixVerdict::GpsDrift;
            }

            last_fix_ = fix;
            last_speed_kmh_ = speed_kmh;

            if (speed_kmh > config_.stop_speed_threshold) {
                ++consecutive_overspeed_;
                if (consecutive_overspeed_ >= config_.stop_consecutive_count) {
                    alert_ = SpeedAlert::Fatal;
                    journal_log(journal_, LogLevel::Error,
                                "Sustained overspeed at " + format_speed(speed_kmh) + ", stopping tracking");
                    return FixVerdict::SpeedViolationFatal;
                }
                alert_ = SpeedAlert::Warning;
                journal_log(journal_, LogLevel::Warning, "Moving too fast at " + format_speed(speed_kmh));
                return FixVerdict::SpeedWarning;
            }

            if (speed_kmh > config_.warning_speed_threshold) {
                ++consecutive_overspeed_;
                if (consecutive_overspeed_ >= config_.warning_consecutive_count) {
                    alert_ = SpeedAlert::Warning;
                    journal_log(journal_, LogLevel::Warning,
                                "Sustained overspeed at " + format_speed(speed_kmh) + ", please walk");
                    return FixVerdict::SpeedWarning;
                }
                return FixVerdict::Overspeed;
            }

            consecutive_overspeed_ = 0;
            if (alert_ != SpeedAlert::None) {
                alert_ = SpeedAlert::None;
                journal_log(journal_, LogLevel::Info, "Speed back to normal");
            }
            return FixVerdict::Accepted;
        }

        /// Forget the previous fix, the counter and any alert
        inline void reset() {
            last_fix_.reset();
            consecutive_overspeed_ = 0;
            last_speed_kmh_ = 0.0;
            alert_ = SpeedAlert::None;
        }

        /// Clear the counter and alert but keep the reference fix
        inline void clear_alert() {
            consecutive_overspeed_ = 0;
            alert_ = SpeedAlert::None;
        }

        inline int consecutive_overspeed_count() const { return consecutive_overspeed_; }
        inline const std::optional<Fix> &last_recorded_fix() const { return last_fix_; }
        inline double last_speed_kmh() const { return last_speed_kmh_; }
        inline SpeedAlert alert() const { return alert_; }

      private:
        static inline std::string format_speed(double speed_kmh) {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(0) << speed_kmh << " km/h";
            return ss.str();
        }

        SpeedConfig config_;
        Journal *journal_;
        std::optional<Fix> last_fix_;
        int consecutive_overspeed_ = 0;
        double last_speed_kmh_ = 0.0;
        SpeedAlert alert_ = SpeedAlert::None;
    };

} // namespace claimtrax
