#include <catch2/catch_test_macros.hpp>
#include "watcher/StatusWatcher.hpp"
#include "utils/Dispatcher.hpp"
#include "../utils/mock_http.hpp"

#include <future>
#include <stdexcept>
#include <vector>

using namespace watcher;
using test_utils::MockHttpClient;
using test_utils::MockResponse;
using test_utils::MockResponses;

namespace {

const std::string kBase = "http://drop.local:8080";
const std::string kStatusUrl = kBase + "/status";

class RecordingSink : public NotificationSink {
public:
    bool deliver(const Notification& notification) override {
        delivered.push_back(notification);
        if (throwOnDeliver) {
            throw std::runtime_error("notifications disabled");
        }
        return accept;
    }

    std::vector<Notification> delivered;
    bool accept = true;
    bool throwOnDeliver = false;
};

WatcherSettings manualSettings() {
    WatcherSettings settings;
    settings.poll_interval_ms = 60 * 60 * 1000; // ticks never fire during a test
    return settings;
}

MockResponse statusFor(const std::string& name) {
    return name == kWaitingSentinel ? MockResponses::status_empty() : MockResponses::status_received(name);
}

}  // namespace

TEST_CASE("StatusWatcher notifications", "[watcher]") {
    utils::Dispatcher dispatcher;
    MockHttpClient http;
    RecordingSink sink;
    StatusWatcher watcher(dispatcher, http, sink, manualSettings());
    watcher.setServer(kBase + "/");

    auto pollWith = [&](const MockResponse& response) {
        http.setResponse(kStatusUrl, response);
        watcher.refreshNow();
        dispatcher.drainUntilIdle();
    };

    SECTION("Fires on transitions only, never on first contact or repeats") {
        const std::vector<std::string> sequence = {kWaitingSentinel, kWaitingSentinel, "a.txt", "a.txt", "b.txt"};
        for (const auto& name : sequence) {
            pollWith(statusFor(name));
        }

        REQUIRE(sink.delivered.size() == 2);
        REQUIRE(sink.delivered[0].fileName == "a.txt");
        REQUIRE(sink.delivered[1].fileName == "b.txt");
        REQUIRE(watcher.state().lastFileName == "b.txt");
    }

    SECTION("First contact with a file is silent") {
        pollWith(MockResponses::status_received("old.txt"));
        REQUIRE(sink.delivered.empty());
        REQUIRE(watcher.state().lastFileName == "old.txt");
        REQUIRE(watcher.state().isConnected);
        REQUIRE(watcher.state().statusMessage == "Connected to server");
    }

    SECTION("Title follows the field the name came from") {
        pollWith(MockResponses::status_empty());
        pollWith(MockResponses::status_received("in.txt"));
        pollWith(MockResponses::status_sent("out.txt"));

        REQUIRE(sink.delivered.size() == 2);
        REQUIRE(sink.delivered[0].title == "File Ready");
        REQUIRE(sink.delivered[0].body == "Tap to download: in.txt");
        REQUIRE(sink.delivered[1].title == "File Sent");
        REQUIRE(sink.delivered[1].body == "Desktop sent: out.txt");
        REQUIRE(watcher.state().lastSent.has_value());
        REQUIRE(watcher.state().lastSent->name == "out.txt");
    }

    SECTION("A sent file is announced once, after the transfer succeeds") {
        pollWith(MockResponses::status_received("in.txt"));
        pollWith(MockResponses::status_sending("out.bin"));
        pollWith(MockResponses::status_sending("out.bin"));
        REQUIRE(sink.delivered.empty());
        REQUIRE(watcher.state().lastFileName == "in.txt");

        pollWith(MockResponses::status_sent("out.bin"));
        pollWith(MockResponses::status_sent("out.bin"));

        REQUIRE(sink.delivered.size() == 1);
        REQUIRE(sink.delivered[0].title == "File Sent");
        REQUIRE(sink.delivered[0].body == "Desktop sent: out.bin");
        REQUIRE(watcher.state().lastFileName == "out.bin");
    }

    SECTION("Returning to the sentinel is recorded but not announced") {
        pollWith(MockResponses::status_received("a.txt"));
        pollWith(MockResponses::status_empty());
        REQUIRE(sink.delivered.empty());
        REQUIRE(watcher.state().lastFileName == kWaitingSentinel);
    }

    SECTION("Notification callbacks see every emitted notification") {
        std::vector<std::string> seen;
        watcher.onNotification([&](const Notification& n) { seen.push_back(n.fileName); });
        pollWith(MockResponses::status_empty());
        pollWith(MockResponses::status_received("c.txt"));
        REQUIRE(seen == std::vector<std::string>{"c.txt"});
    }

    SECTION("Delivery failures never stop polling") {
        sink.throwOnDeliver = true;
        pollWith(MockResponses::status_empty());
        pollWith(MockResponses::status_received("a.txt"));
        pollWith(MockResponses::status_received("b.txt"));

        REQUIRE(sink.delivered.size() == 2);
        REQUIRE(watcher.state().lastFileName == "b.txt");
        REQUIRE(watcher.state().isConnected);
    }

    SECTION("Refused delivery is only logged") {
        sink.accept = false;
        pollWith(MockResponses::status_empty());
        pollWith(MockResponses::status_received("a.txt"));
        REQUIRE(sink.delivered.size() == 1);
        REQUIRE(watcher.state().lastFileName == "a.txt");
    }
}

TEST_CASE("StatusWatcher connectivity", "[watcher]") {
    utils::Dispatcher dispatcher;
    MockHttpClient http;
    RecordingSink sink;
    StatusWatcher watcher(dispatcher, http, sink, manualSettings());
    watcher.setServer(kBase);

    SECTION("Initial state before any poll") {
        REQUIRE(watcher.state().lastFileName == kWaitingSentinel);
        REQUIRE_FALSE(watcher.state().isConnected);
        REQUIRE(watcher.state().statusMessage == "Connecting...");
    }

    SECTION("Failures keep the last file name") {
        http.setResponse(kStatusUrl, MockResponses::status_received("keep.txt"));
        watcher.refreshNow();
        dispatcher.drainUntilIdle();

        http.simulateNetworkError("Connection refused");
        watcher.refreshNow();
        dispatcher.drainUntilIdle();

        REQUIRE_FALSE(watcher.state().isConnected);
        REQUIRE(watcher.state().statusMessage == "Connection refused");
        REQUIRE(watcher.state().lastFileName == "keep.txt");
    }

    SECTION("HTTP errors and undecodable bodies count as failures") {
        http.setResponse(kStatusUrl, MockResponses::http_error(500));
        watcher.refreshNow();
        dispatcher.drainUntilIdle();
        REQUIRE_FALSE(watcher.state().isConnected);
        REQUIRE(watcher.state().statusMessage == "HTTP error 500");

        MockResponse garbage;
        garbage.body = "<html>";
        http.setResponse(kStatusUrl, garbage);
        watcher.refreshNow();
        dispatcher.drainUntilIdle();
        REQUIRE_FALSE(watcher.state().isConnected);
        REQUIRE(watcher.state().statusMessage.find("JSON parse error") != std::string::npos);
    }

    SECTION("Recovery after an outage does not re-announce the same file") {
        http.setResponse(kStatusUrl, MockResponses::status_received("a.txt"));
        watcher.refreshNow();
        dispatcher.drainUntilIdle();

        http.simulateNetworkError("timeout");
        watcher.refreshNow();
        dispatcher.drainUntilIdle();

        http.clearResponses();
        http.setResponse(kStatusUrl, MockResponses::status_received("a.txt"));
        watcher.refreshNow();
        dispatcher.drainUntilIdle();

        REQUIRE(watcher.state().isConnected);
        REQUIRE(sink.delivered.empty());
    }

    SECTION("Polls bypass caches and use short timeouts") {
        http.setResponse(kStatusUrl, MockResponses::status_empty());
        watcher.refreshNow();
        dispatcher.drainUntilIdle();

        auto requests = http.requestsTo(kStatusUrl);
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].method == "GET");
        REQUIRE(requests[0].config.bypass_cache);
        REQUIRE(requests[0].config.timeout_ms == 5000);
    }

    SECTION("Subscribers receive every applied poll") {
        std::vector<bool> connected;
        watcher.subscribe([&](const WatcherState& s) { connected.push_back(s.isConnected); });

        http.setResponse(kStatusUrl, MockResponses::status_empty());
        watcher.refreshNow();
        dispatcher.drainUntilIdle();
        http.simulateNetworkError("down");
        watcher.refreshNow();
        dispatcher.drainUntilIdle();

        REQUIRE(connected == std::vector<bool>{true, false});
    }
}

TEST_CASE("StatusWatcher out-of-order responses", "[watcher]") {
    utils::Dispatcher dispatcher;
    MockHttpClient http;
    RecordingSink sink;

    auto runOverlappingPolls = [&](StatusWatcher& watcher) {
        watcher.setServer(kBase);

        MockResponse slow = MockResponses::status_received("old.txt");
        slow.delay_ms = 200;
        http.setResponse(kStatusUrl, slow);
        watcher.refreshNow();
        REQUIRE(http.waitForRequests(1));

        http.setResponse(kStatusUrl, MockResponses::status_received("new.txt"));
        watcher.refreshNow();
        dispatcher.drainUntilIdle();
    };

    SECTION("Stale completions are dropped by default") {
        StatusWatcher watcher(dispatcher, http, sink, manualSettings());
        runOverlappingPolls(watcher);
        REQUIRE(watcher.state().lastFileName == "new.txt");
    }

    SECTION("Arrival order wins when discarding is off") {
        WatcherSettings settings = manualSettings();
        settings.discard_stale_responses = false;
        StatusWatcher watcher(dispatcher, http, sink, settings);
        runOverlappingPolls(watcher);
        REQUIRE(watcher.state().lastFileName == "old.txt");
    }
}

TEST_CASE("StatusWatcher auto-download hand-off", "[watcher]") {
    utils::Dispatcher dispatcher;
    MockHttpClient http;
    RecordingSink sink;

    SECTION("Flag is consumed exactly once") {
        StatusWatcher watcher(dispatcher, http, sink, manualSettings());
        REQUIRE_FALSE(watcher.consumeAutoDownloadRequest());

        watcher.handleNotificationResponse();
        watcher.handleNotificationResponse(); // overwrites, does not queue
        REQUIRE(watcher.state().autoDownloadRequested);
        REQUIRE(watcher.consumeAutoDownloadRequest());
        REQUIRE_FALSE(watcher.consumeAutoDownloadRequest());
        REQUIRE_FALSE(watcher.state().autoDownloadRequested);
    }

    SECTION("Headless mode requests a download for each notification") {
        WatcherSettings settings = manualSettings();
        settings.auto_fetch_on_notify = true;
        StatusWatcher watcher(dispatcher, http, sink, settings);
        watcher.setServer(kBase);

        http.setResponse(kStatusUrl, MockResponses::status_empty());
        watcher.refreshNow();
        dispatcher.drainUntilIdle();
        REQUIRE_FALSE(watcher.consumeAutoDownloadRequest());

        http.setResponse(kStatusUrl, MockResponses::status_received("a.txt"));
        watcher.refreshNow();
        dispatcher.drainUntilIdle();
        REQUIRE(watcher.consumeAutoDownloadRequest());
    }
}

TEST_CASE("StatusWatcher lifecycle", "[watcher]") {
    utils::Dispatcher dispatcher;
    MockHttpClient http;
    RecordingSink sink;
    StatusWatcher watcher(dispatcher, http, sink, manualSettings());
    http.setResponse(kStatusUrl, MockResponses::status_received("a.txt"));

    SECTION("start polls immediately") {
        watcher.start(kBase + "/");
        REQUIRE(watcher.isRunning());
        REQUIRE(watcher.baseUrl() == kBase);
        dispatcher.drainUntilIdle();

        REQUIRE(http.requestsTo(kStatusUrl).size() == 1);
        REQUIRE(watcher.state().lastFileName == "a.txt");

        watcher.stop();
        REQUIRE_FALSE(watcher.isRunning());
    }

    SECTION("Short intervals keep polling until stopped") {
        WatcherSettings fast;
        fast.poll_interval_ms = 20;
        StatusWatcher ticking(dispatcher, http, sink, fast);
        ticking.start(kBase);
        REQUIRE(http.waitForRequests(3));
        ticking.stop();
        dispatcher.drainUntilIdle();

        const size_t count = http.requestCount();
        dispatcher.drainUntilIdle();
        REQUIRE(http.requestCount() == count);
        REQUIRE(ticking.state().isConnected);
    }

    SECTION("Waiting files are listed through a callback") {
        MockResponse files;
        files.body = R"({"files": [{"name": "w.txt", "size": 5}]})";
        http.setResponse(kBase + "/files", files);
        watcher.setServer(kBase);

        bool called = false;
        watcher.fetchWaitingFiles([&](bool success, const std::vector<WaitingFile>& list, const std::string&) {
            called = true;
            REQUIRE(success);
            REQUIRE(list.size() == 1);
            REQUIRE(list[0].name == "w.txt");
        });
        dispatcher.drainUntilIdle();
        REQUIRE(called);
    }
}

TEST_CASE("StatusWatcher without a free worker", "[watcher]") {
    utils::Dispatcher dispatcher(1);
    MockHttpClient http;
    http.setResponse(kStatusUrl, MockResponses::status_received("a.txt"));
    RecordingSink sink;
    StatusWatcher watcher(dispatcher, http, sink, manualSettings());
    watcher.setServer(kBase);

    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    REQUIRE(dispatcher.spawn([opened] { opened.wait(); }));

    SECTION("A poll that cannot start reads as offline") {
        watcher.refreshNow();
        REQUIRE(dispatcher.pump() == 1);
        REQUIRE_FALSE(watcher.state().isConnected);
        REQUIRE(watcher.state().statusMessage == "No worker available for the status poll");
    }

    SECTION("A listing that cannot start reports failure") {
        bool called = false;
        bool succeeded = true;
        watcher.fetchWaitingFiles([&](bool success, const std::vector<WaitingFile>&, const std::string&) {
            called = true;
            succeeded = success;
        });
        dispatcher.pump();
        REQUIRE(called);
        REQUIRE_FALSE(succeeded);
    }

    gate.set_value();
    dispatcher.drainUntilIdle();
    REQUIRE(http.requestCount() == 0);
}
