#include "claimtrax/journal.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace claimtrax {

    namespace {

        std::string format_time(const Timestamp &ts, const char *pattern) {
            std::time_t t = Clock::to_time_t(ts);
            std::tm tm{};
            localtime_r(&t, &tm);
            std::ostringstream ss;
            ss << std::put_time(&tm, pattern);
            return ss.str();
        }

    } // namespace

    Journal::Journal(std::size_t capacity, bool echo) : capacity_(capacity), echo_(echo) {
        if (capacity_ == 0)
            throw std::invalid_argument("journal capacity must be positive");
    }

    void Journal::log(LogLevel level, const std::string &message) {
        LogEntry entry{Clock::now(), level, message};

        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(entry);
        while (entries_.size() > capacity_) {
            entries_.pop_front();
        }

        if (echo_) {
            auto &out = (level == LogLevel::Warning || level == LogLevel::Error) ? std::cerr : std::cout;
            out << "[claimtrax " << format_time(entry.timestamp, "%H:%M:%S") << "] [" << log_level_to_string(level)
                << "] " << message << std::endl;
        }
    }

    std::vector<LogEntry> Journal::entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<LogEntry>(entries_.begin(), entries_.end());
    }

    std::size_t Journal::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void Journal::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    void Journal::set_echo(bool echo) {
        std::lock_guard<std::mutex> lock(mutex_);
        echo_ = echo;
    }

    std::string Journal::export_text() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream ss;
        ss << "=== claimtrax tracking log ===\n";
        ss << "Exported: " << format_time(Clock::now(), "%Y-%m-%d %H:%M:%S") << "\n";
        ss << "Entries: " << entries_.size() << "\n\n";
        for (const auto &entry : entries_) {
            ss << "[" << format_time(entry.timestamp, "%Y-%m-%d %H:%M:%S") << "] [" << log_level_to_string(entry.level)
               << "] " << entry.message << "\n";
        }
        return ss.str();
    }

} // namespace claimtrax
