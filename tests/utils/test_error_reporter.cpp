#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace utils;

TEST_CASE("ErrorReporter queue", "[utils][errors]") {
    SECTION("Reports are queued with category and severity") {
        ErrorReporter::ReportWarning(ErrorCategory::Network, "Update check failed", "HTTP error 500");
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Failed to save configuration");

        auto reports = ErrorReporter::GetPendingErrors();
        REQUIRE(reports.size() == 2);
        REQUIRE(reports[0].category == ErrorCategory::Network);
        REQUIRE(reports[0].severity == ErrorSeverity::Warning);
        REQUIRE(reports[0].details == "HTTP error 500");
        REQUIRE(reports[0].describe() == "Update check failed: HTTP error 500");
        REQUIRE(reports[1].severity == ErrorSeverity::Error);
        REQUIRE(reports[1].describe() == "Failed to save configuration");
        REQUIRE(reports[1].time.time_since_epoch().count() != 0);

        REQUIRE(ErrorReporter::GetPendingErrors().empty());
    }

    SECTION("Transfer failures name the file") {
        ErrorReporter::ReportTransferFailure("pull", "docs/a.txt", "HTTP error 404");

        auto reports = ErrorReporter::GetPendingErrors();
        REQUIRE(reports.size() == 1);
        REQUIRE(reports[0].category == ErrorCategory::Transfer);
        REQUIRE(reports[0].severity == ErrorSeverity::Error);
        REQUIRE(reports[0].subject == "docs/a.txt");
        REQUIRE(reports[0].describe() == "Failed to pull docs/a.txt: HTTP error 404");
    }

    SECTION("Queue is bounded and keeps the newest reports") {
        for (int i = 0; i < 150; ++i) {
            ErrorReporter::ReportError(ErrorCategory::Unknown, std::to_string(i));
        }
        auto reports = ErrorReporter::GetPendingErrors();
        REQUIRE(reports.size() == 100);
        REQUIRE(reports.front().message == "50");
        REQUIRE(reports.back().message == "149");
    }

    SECTION("Workers can report concurrently") {
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([] {
                for (int i = 0; i < 10; ++i) {
                    ErrorReporter::ReportWarning(ErrorCategory::Transfer, "x");
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        REQUIRE(ErrorReporter::GetPendingErrors().size() == 40);
    }
}

TEST_CASE("Which reports fail a command", "[utils][errors]") {
    auto report = [](ErrorCategory category, ErrorSeverity severity) {
        ErrorReport r;
        r.category = category;
        r.severity = severity;
        return r;
    };

    REQUIRE(report(ErrorCategory::Network, ErrorSeverity::Warning).countsAsFailure());
    REQUIRE(report(ErrorCategory::Permission, ErrorSeverity::Warning).countsAsFailure());
    REQUIRE(report(ErrorCategory::Configuration, ErrorSeverity::Error).countsAsFailure());
    REQUIRE(report(ErrorCategory::Initialization, ErrorSeverity::Fatal).countsAsFailure());
    REQUIRE_FALSE(report(ErrorCategory::Configuration, ErrorSeverity::Warning).countsAsFailure());
    REQUIRE(std::string(to_string(ErrorCategory::Permission)) == "Permission");
}
