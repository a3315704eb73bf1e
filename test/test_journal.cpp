#include "doctest/doctest.h"
#include "claimtrax/journal.hpp"

#include <stdexcept>
#include <thread>
#include <vector>

using namespace claimtrax;

TEST_CASE("Journal keeps entries in order") {
    Journal journal(10, false);
    journal.info("started");
    journal.success("closed");
    journal.warning("drift");
    journal.error("failed");

    auto entries = journal.entries();
    REQUIRE(entries.size() == 4);
    CHECK(entries[0].level == LogLevel::Info);
    CHECK(entries[1].level == LogLevel::Success);
    CHECK(entries[2].level == LogLevel::Warning);
    CHECK(entries[3].level == LogLevel::Error);
    CHECK(entries[3].message == "failed");
    CHECK(entries[0].timestamp <= entries[3].timestamp);
}

TEST_CASE("Journal drops the oldest entries beyond capacity") {
    Journal journal(3, false);
    for (int i = 0; i < 5; ++i)
        journal.info("entry " + std::to_string(i));

    auto entries = journal.entries();
    CHECK(journal.size() == 3);
    CHECK(journal.capacity() == 3);
    CHECK(entries.front().message == "entry 2");
    CHECK(entries.back().message == "entry 4");

    journal.clear();
    CHECK(journal.size() == 0);
}

TEST_CASE("Journal default capacity") {
    Journal journal;
    CHECK(journal.capacity() == 200);
    CHECK_THROWS_AS(Journal(0), std::invalid_argument);
}

TEST_CASE("Journal export") {
    Journal journal(10, false);
    journal.info("Tracking started");
    journal.error("Validation failed");

    std::string text = journal.export_text();
    CHECK(text.rfind("=== claimtrax tracking log ===", 0) == 0);
    CHECK(text.find("Entries: 2") != std::string::npos);
    CHECK(text.find("[INFO] Tracking started") != std::string::npos);
    CHECK(text.find("[ERROR] Validation failed") != std::string::npos);
}

TEST_CASE("Journal accepts concurrent writers") {
    Journal journal(1000, false);
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&journal] {
            for (int i = 0; i < 100; ++i)
                journal.info("tick");
        });
    }
    for (auto &w : writers)
        w.join();
    CHECK(journal.size() == 400);
}

TEST_CASE("Null journal drops messages") {
    journal_log(nullptr, LogLevel::Error, "nobody listens");

    Journal journal(5, false);
    journal_log(&journal, LogLevel::Warning, "somebody listens");
    CHECK(journal.size() == 1);
    CHECK(std::string(log_level_to_string(journal.entries().front().level)) == "WARNING");
}

TEST_CASE("Echo can be switched without affecting the record") {
    Journal journal(5, true);
    journal.set_echo(false);
    journal.info("quiet");
    journal.set_echo(true);
    journal.success("loud");

    auto entries = journal.entries();
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].message == "quiet");
    CHECK(entries[1].level == LogLevel::Success);
}
