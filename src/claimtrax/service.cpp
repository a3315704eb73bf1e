#include "claimtrax/service.hpp"

#include <stdexcept>
#include <utility>

namespace claimtrax {

    TrackingService::TrackingService(const Config &config, std::string owner_id, Journal &journal)
        : config_(config), owner_id_(std::move(owner_id)), journal_(journal),
          session_(config_, owner_id_, roster_, &journal_) {}

    bool TrackingService::start() { return start(Clock::now()); }

    bool TrackingService::start(Timestamp now) {
        SessionSnapshot snap;
        std::uint64_t sequence = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!session_.start(now))
                return false;
            snap = session_.snapshot(now);
            sequence = ++snapshot_sequence_;
        }
        notify(snap, sequence);
        return true;
    }

    FixOutcome TrackingService::on_fix(const Fix &fix) {
        FixOutcome outcome;
        SessionSnapshot snap;
        std::uint64_t sequence = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!session_.tracking())
                return outcome;
            outcome = session_.process_fix(fix);
            snap = session_.snapshot(fix.timestamp);
            sequence = ++snapshot_sequence_;
        }
        notify(snap, sequence);
        return outcome;
    }

    bool TrackingService::on_tick(Timestamp now) {
        SessionSnapshot snap;
        std::uint64_t sequence = 0;
        bool keep_ticking = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!session_.tracking())
                return false;
            session_.tick(now);
            keep_ticking = session_.tracking();
            snap = session_.snapshot(now);
            sequence = ++snapshot_sequence_;
        }
        notify(snap, sequence);
        return keep_ticking;
    }

    std::optional<FinalizeOutcome> TrackingService::stop() { return stop(Clock::now()); }

    std::optional<FinalizeOutcome> TrackingService::stop(Timestamp now) {
        std::optional<FinalizeOutcome> outcome;
        SessionSnapshot snap;
        std::uint64_t sequence = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            outcome = session_.stop(now);
            if (!outcome)
                return outcome;
            snap = session_.snapshot(now);
            sequence = ++snapshot_sequence_;
        }
        notify(snap, sequence);
        return outcome;
    }

    bool TrackingService::resume() {
        SessionSnapshot snap;
        std::uint64_t sequence = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!session_.resume())
                return false;
            snap = session_.snapshot(Clock::now());
            sequence = ++snapshot_sequence_;
        }
        notify(snap, sequence);
        return true;
    }

    void TrackingService::reset() {
        SessionSnapshot snap;
        std::uint64_t sequence = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            session_.reset();
            snap = session_.snapshot(Clock::now());
            sequence = ++snapshot_sequence_;
        }
        notify(snap, sequence);
    }

    void TrackingService::refresh_roster(std::vector<Territory> territories) {
        std::lock_guard<std::mutex> lock(mutex_);
        roster_.replace(std::move(territories));
        journal_.info("Roster refreshed, " + std::to_string(roster_.size()) + " territories");
    }

    bool TrackingService::deactivate_territory(const std::string &id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return roster_.deactivate(id);
    }

    SessionSnapshot TrackingService::snapshot() const { return snapshot(Clock::now()); }

    SessionSnapshot TrackingService::snapshot(Timestamp now) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_.snapshot(now);
    }

    std::optional<TerritoryRecord> TrackingService::claim_record() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_.claim_record();
    }

    std::uint64_t TrackingService::subscribe(SnapshotCallback callback) {
        if (!callback)
            throw std::invalid_argument("Snapshot callback must not be empty");
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        std::uint64_t id = next_subscriber_id_++;
        subscribers_.emplace(id, std::move(callback));
        return id;
    }

    bool TrackingService::unsubscribe(std::uint64_t id) {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        return subscribers_.erase(id) > 0;
    }

    void TrackingService::notify(const SessionSnapshot &snapshot, std::uint64_t sequence) {
        std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);
        if (sequence <= delivered_sequence_)
            return;
        delivered_sequence_ = sequence;

        std::vector<SnapshotCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(subscribers_mutex_);
            callbacks.reserve(subscribers_.size());
            for (const auto &entry : subscribers_)
                callbacks.push_back(entry.second);
        }
        for (const auto &callback : callbacks) {
            // A callback that drove the service has already delivered a newer snapshot
            if (delivered_sequence_ != sequence)
                break;
            callback(snapshot);
        }
    }

    SamplingTicker::SamplingTicker(std::chrono::milliseconds interval, TickFunction tick)
        : interval_(interval), tick_(std::move(tick)) {
        if (interval_.count() <= 0)
            throw std::invalid_argument("Tick interval must be positive");
        if (!tick_)
            throw std::invalid_argument("Tick function must not be empty");
    }

    SamplingTicker::~SamplingTicker() { stop(); }

    bool SamplingTicker::start() {
        if (thread_.joinable()) {
            if (running_.load())
                return false;
            thread_.join();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = false;
        }
        running_ = true;
        thread_ = std::thread(&SamplingTicker::run, this);
        return true;
    }

    void SamplingTicker::stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
        }
        wake_.notify_all();
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
            thread_.join();
    }

    void SamplingTicker::run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stop_requested_) {
            if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; }))
                break;

            lock.unlock();
            bool keep_going = tick_(Clock::now());
            ++ticks_;
            lock.lock();

            if (!keep_going)
                break;
        }
        running_ = false;
    }

} // namespace claimtrax
