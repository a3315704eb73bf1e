#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "claimtrax/config.hpp"
#include "claimtrax/journal.hpp"
#include "claimtrax/session.hpp"
#include "claimtrax/territory.hpp"
#include "claimtrax/types.hpp"

namespace claimtrax {

    using SnapshotCallback = std::function<void(const SessionSnapshot &)>;

    /**
     * @brief Thread-safe front of one tracking session
     *
     * Fixes, ticks and user commands may arrive from different threads; every entry
     * point takes the same lock. Subscribers receive a snapshot after each state
     * change and are called without the session lock held, so they may call back
     * into the service. Deliveries are serialized and numbered: a snapshot older
     * than one already delivered is dropped.
     */
    class TrackingService {
      public:
        /**
         * @brief Construct a service for one user
         *
         * @param config Engine configuration (validated)
         * @param owner_id Id of the user claiming territory
         * @param journal Journal receiving tracking events (must outlive the service)
         * @throws std::invalid_argument if the configuration is unusable
         */
        TrackingService(const Config &config, std::string owner_id, Journal &journal);

        TrackingService(const TrackingService &) = delete;
        TrackingService &operator=(const TrackingService &) = delete;

        bool start();
        bool start(Timestamp now);

        /**
         * @brief Deliver a positional fix from the platform
         */
        FixOutcome on_fix(const Fix &fix);

        /**
         * @brief Periodic sampling tick
         *
         * Re-evaluates the current position against the roster at the tick time. Only
         * delivered fixes feed the speed filter and the sampler.
         *
         * @return false once the session is no longer tracking
         */
        bool on_tick(Timestamp now);

        std::optional<FinalizeOutcome> stop();
        std::optional<FinalizeOutcome> stop(Timestamp now);

        bool resume();
        void reset();

        /**
         * @brief Replace the roster of known territories
         *
         * The next recorded vertex and finalization see the new roster.
         */
        void refresh_roster(std::vector<Territory> territories);

        /// Soft-delete a territory in the roster
        bool deactivate_territory(const std::string &id);

        SessionSnapshot snapshot() const;
        SessionSnapshot snapshot(Timestamp now) const;

        std::optional<TerritoryRecord> claim_record() const;

        /**
         * @brief Register a snapshot observer
         *
         * @return Id for unsubscribe()
         * @throws std::invalid_argument if the callback is empty
         */
        std::uint64_t subscribe(SnapshotCallback callback);

        /// @return false if no observer has that id
        bool unsubscribe(std::uint64_t id);

        const Config &config() const { return config_; }
        const std::string &owner_id() const { return owner_id_; }

      private:
        void notify(const SessionSnapshot &snapshot, std::uint64_t sequence);

        Config config_;
        std::string owner_id_;
        Journal &journal_;

        mutable std::mutex mutex_;
        TerritoryRoster roster_;
        TrackingSession session_;
        std::uint64_t snapshot_sequence_ = 0; ///< Guarded by mutex_

        std::recursive_mutex delivery_mutex_;
        std::uint64_t delivered_sequence_ = 0; ///< Guarded by delivery_mutex_

        std::mutex subscribers_mutex_;
        std::map<std::uint64_t, SnapshotCallback> subscribers_;
        std::uint64_t next_subscriber_id_ = 1;
    };

    /**
     * @brief Calls a tick function at a fixed interval on a background thread
     *
     * The thread ends when the function returns false or stop() is called.
     */
    class SamplingTicker {
      public:
        using TickFunction = std::function<bool(Timestamp)>;

        /**
         * @throws std::invalid_argument if the interval is not positive or the function is empty
         */
        SamplingTicker(std::chrono::milliseconds interval, TickFunction tick);
        ~SamplingTicker();

        SamplingTicker(const SamplingTicker &) = delete;
        SamplingTicker &operator=(const SamplingTicker &) = delete;

        /// @return false if already running
        bool start();

        /// Stop and join; safe to call repeatedly
        void stop();

        bool running() const { return running_.load(); }
        std::size_t tick_count() const { return ticks_.load(); }

      private:
        void run();

        std::chrono::milliseconds interval_;
        TickFunction tick_;

        std::mutex mutex_;
        std::condition_variable wake_;
        bool stop_requested_ = false;
        std::atomic<bool> running_{false};
        std::atomic<std::size_t> ticks_{0};
        std::thread thread_;
    };

} // namespace claimtrax
