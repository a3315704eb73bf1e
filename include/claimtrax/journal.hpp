#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "claimtrax/types.hpp"

namespace claimtrax {

    enum class LogLevel { Info, Success, Warning, Error };

    inline const char *log_level_to_string(LogLevel level) {
        switch (level) {
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Success:
            return "SUCCESS";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Error:
            return "ERROR";
        }
        return "UNKNOWN";
    }

    struct LogEntry {
        Timestamp timestamp;
        LogLevel level;
        std::string message;
    };

    /**
     * @brief Bounded, thread-safe log of claim-tracking events
     *
     * Keeps the newest `capacity` entries so a field test can be exported afterwards,
     * and echoes each entry to stdout/stderr while `echo` is enabled.
     */
    class Journal {
      public:
        explicit Journal(std::size_t capacity = 200, bool echo = true);

        void log(LogLevel level, const std::string &message);

        void info(const std::string &message) { log(LogLevel::Info, message); }
        void success(const std::string &message) { log(LogLevel::Success, message); }
        void warning(const std::string &message) { log(LogLevel::Warning, message); }
        void error(const std::string &message) { log(LogLevel::Error, message); }

        std::vector<LogEntry> entries() const;
        std::size_t size() const;
        std::size_t capacity() const { return capacity_; }
        void clear();

        void set_echo(bool echo);

        /**
         * @brief Render all entries as text with a header line block
         */
        std::string export_text() const;

      private:
        mutable std::mutex mutex_;
        std::deque<LogEntry> entries_;
        std::size_t capacity_;
        bool echo_;
    };

    /// Log through an optional journal; a null journal drops the message
    inline void journal_log(Journal *journal, LogLevel level, const std::string &message) {
        if (journal)
            journal->log(level, message);
    }

} // namespace claimtrax
